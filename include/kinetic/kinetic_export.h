#ifndef KINETIC_EXPORT_H
#define KINETIC_EXPORT_H

#if defined _WIN32 || defined __CYGWIN__
#ifdef kinetic_EXPORTS
#ifdef __GNUC__
#define KINETIC_EXPORT __attribute__ ((dllexport))
#else
#define KINETIC_EXPORT __declspec(dllexport)
#define KINETIC_DLL_WARNING_DISABLE_4251
#endif
#else
#ifdef __GNUC__
#define KINETIC_EXPORT __attribute__ ((dllimport))
#else
#define KINETIC_EXPORT __declspec(dllimport)
#endif
#endif
#else
#if __GNUC__ >= 4
#define KINETIC_EXPORT __attribute__ ((visibility ("default")))
#else
#define KINETIC_EXPORT
#endif
#endif

#ifdef KINETIC_DLL_WARNING_DISABLE_4251
#pragma warning( disable : 4251 )
#pragma warning( disable : 4275 )
#endif

#endif // KINETIC_EXPORT_H
