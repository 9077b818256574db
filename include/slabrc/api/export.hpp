#pragma once

#if defined(_WIN32)
#if defined(SLABRC_BUILD_DLL)
#define SLABRC_API __declspec(dllexport)
#elif defined(SLABRC_USE_DLL)
#define SLABRC_API __declspec(dllimport)
#else
#define SLABRC_API
#endif
#else
#define SLABRC_API
#endif
