#pragma once

#if (defined(_WIN32) || defined(WIN32))
# define __WIN__
#elif (defined(__linux__) || defined(__linux))
# define __LINUX__
#endif

#if !defined(__WIN__) && !defined(__LINUX__)
# error "Only support win and linux"
#endif

#if defined(__WIN__)
# ifndef WIN32_LEAN_AND_MEAN
#  define WIN32_LEAN_AND_MEAN
# endif
# ifndef _CRT_SECURE_NO_WARNINGS
#  define _CRT_SECURE_NO_WARNINGS
# endif
#endif
