#pragma once

#include <StormByte/platform.h>

#ifdef WINDOWS
	#ifdef Bufio_EXPORTS
		#define BUFIO_PUBLIC	__declspec(dllexport)
	#else
		#define BUFIO_PUBLIC	__declspec(dllimport)
	#endif
	#define BUFIO_PRIVATE
#else
	#define BUFIO_PUBLIC		__attribute__ ((visibility ("default")))
	#define BUFIO_PRIVATE		__attribute__ ((visibility ("hidden")))
#endif
