#ifndef _ROXFS_API_DEFS_H
#define _ROXFS_API_DEFS_H

#if (defined _WINDOWS)
#  ifdef ROXFS_API_EXPORTS
#    define ROXFS_API_DECL __declspec (dllexport)
#  else
#    define ROXFS_API_DECL __declspec (dllimport)
#  endif
#else
#  define ROXFS_API_DECL __attribute__((visibility("default")))
#endif

#endif
