/*
 *    config.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef LIGHT_READER_CONFIG_HPP
#define LIGHT_READER_CONFIG_HPP

#define LIGHT_READER_PLATFORM_UKNOWN        0
#define LIGHT_READER_PLATFORM_WIN_DESKTOP   1
#define LIGHT_READER_PLATFORM_WIN_UWP       2
#define LIGHT_READER_PLATFORM_POSIX         3

#ifdef _WIN32
	#include <winapifamily.h>
	#if WINAPI_FAMILY == WINAPI_FAMILY_DESKTOP_APP
		#define LIGHT_READER_PLATFORM LIGHT_READER_PLATFORM_WIN_DESKTOP
	#elif WINAPI_FAMILY == WINAPI_FAMILY_APP
		#define LIGHT_READER_PLATFORM LIGHT_READER_PLATFORM_WIN_UWP
	#else
		#error "Unsupported platform."
	#endif
#elif defined(__unix__) || defined(__APPLE__)
	#define LIGHT_READER_PLATFORM LIGHT_READER_PLATFORM_POSIX
#else
	#error "Unsupported platform."
#endif

#if LIGHT_READER_PLATFORM == LIGHT_READER_PLATFORM_WIN_DESKTOP
#if defined(LIGHT_READER_EXPORTS)
#   define LIGHT_READER_API __declspec(dllexport)
#elif defined(LIGHT_READER_STATIC)
#   define LIGHT_READER_API
#else
#   define LIGHT_READER_API __declspec(dllimport)
#endif
#else
#	define LIGHT_READER_API
#endif

// Copies shorter than this many bytes go through a byte loop instead of memcpy.
#ifndef LIGHT_READER_SMALL_COPY_THRESHOLD
#define LIGHT_READER_SMALL_COPY_THRESHOLD 9
#endif

#endif // LIGHT_READER_CONFIG_HPP
