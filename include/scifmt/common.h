#pragma once

#include <cstddef>
#include <cstdint>

#define SCIFMT_VERSION_MAJOR 1
#define SCIFMT_VERSION_MINOR 0
#define SCIFMT_VERSION_PATCH 0

#if !defined(SCIFMT_EXPORT)
#    if defined(SCIFMT_SHARED) && defined(_MSC_VER)
#        if defined(SCIFMT_BUILDING)
#            define SCIFMT_EXPORT __declspec(dllexport)
#        else
#            define SCIFMT_EXPORT __declspec(dllimport)
#        endif
#    elif defined(SCIFMT_SHARED) && defined(__GNUC__)
#        define SCIFMT_EXPORT __attribute__((visibility("default")))
#    else
#        define SCIFMT_EXPORT
#    endif
#endif  // !defined(SCIFMT_EXPORT)

#if !defined(SCIFMT_EXPORT_ALL_STUFF_FOR_GNUC)
#    ifdef __GNUC__
#        define SCIFMT_EXPORT_ALL_STUFF_FOR_GNUC SCIFMT_EXPORT
#    else
#        define SCIFMT_EXPORT_ALL_STUFF_FOR_GNUC
#    endif
#endif

#if !defined(SCIFMT_UNREACHABLE_CODE)
#    if defined(_MSC_VER)
#        define SCIFMT_UNREACHABLE_CODE __assume(false)
#    elif defined(__GNUC__)
#        define SCIFMT_UNREACHABLE_CODE __builtin_unreachable()
#    else
#        define SCIFMT_UNREACHABLE_CODE
#    endif
#endif  // !defined(SCIFMT_UNREACHABLE_CODE)
