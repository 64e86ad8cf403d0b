#pragma once

#include <StormByte/platform.h>

#ifdef WINDOWS
	#ifdef Trickle_Stream_EXPORTS
		#define TRICKLE_STREAM_PUBLIC	__declspec(dllexport)
	#else
		#define TRICKLE_STREAM_PUBLIC	__declspec(dllimport)
	#endif
	#define TRICKLE_STREAM_PRIVATE
#else
	#define TRICKLE_STREAM_PUBLIC		__attribute__ ((visibility ("default")))
	#define TRICKLE_STREAM_PRIVATE	__attribute__ ((visibility ("hidden")))
#endif
