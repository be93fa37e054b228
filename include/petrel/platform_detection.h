// Copyright 2018 Vladislav Yaremenko
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with the License. You may obtain a copy of the License at http://www.apache.org/licenses/LICENSE-2.0 . Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the specific language governing permissions and limitations under the License.

#pragma once

#if defined(_MSC_VER)
#   include <winapifamily.h>
#endif

/*
 * OS detection
 */

#if defined(__ANDROID__) || defined(ANDROID)
#   define PETREL_OS_ANDROID
#   define PETREL_OS_LINUX
#elif defined(__CYGWIN__)
#   define PETREL_OS_CYGWIN
#elif !defined(SAG_COM) && (!defined(WINAPI_FAMILY) || WINAPI_FAMILY==WINAPI_FAMILY_DESKTOP_APP) && (defined(WIN64) || defined(_WIN64) || defined(__WIN64__))
#   define PETREL_OS_WIN32
#   define PETREL_OS_WIN64
#elif !defined(SAG_COM) && (defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__))
#   if defined(WINAPI_FAMILY)
#       if !defined(WINAPI_FAMILY_PC_APP)
#           define WINAPI_FAMILY_PC_APP WINAPI_FAMILY_APP
#       endif
#       if defined(WINAPI_FAMILY_PHONE_APP) && WINAPI_FAMILY==WINAPI_FAMILY_PHONE_APP
#           define PETREL_OS_WINRT
#       elif WINAPI_FAMILY==WINAPI_FAMILY_PC_APP
#           define PETREL_OS_WINRT
#       else
#           define PETREL_OS_WIN32
#       endif
#   else
#       define PETREL_OS_WIN32
#   endif
#elif defined(__APPLE__) && defined(__MACH__)
#   define PETREL_OS_DARWIN
#elif defined(__linux__) || defined(__linux)
#   define PETREL_OS_LINUX
#elif defined(__FreeBSD__) || defined(__DragonFly__) || defined(__FreeBSD_kernel__)
#   define PETREL_OS_FREEBSD
#elif defined(__NetBSD__)
#elif defined(__OpenBSD__)
#elif defined(__GNU__)
#elif defined(__QNXNTO__)
#elif defined(__HAIKU__)
#else
#   error "Unknown OS"
#endif

#if defined(PETREL_OS_WIN32) || defined(PETREL_OS_WIN64) || defined(PETREL_OS_WINRT)
#   define PETREL_OS_WIN
#endif

#if defined(PETREL_OS_WIN)
#   undef PETREL_OS_UNIX
#elif !defined(PETREL_OS_UNIX)
#   define PETREL_OS_UNIX
#endif

/*
 * Thread naming support
 */

#if defined(PETREL_OS_LINUX) || defined(PETREL_OS_FREEBSD)
#   define PETREL_HAS_PTHREAD_SETNAME
#elif defined(PETREL_OS_DARWIN)
#   define PETREL_HAS_PTHREAD_SETNAME_SELF
#endif
