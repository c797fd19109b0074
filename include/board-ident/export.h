#ifndef BOARD_IDENT_EXPORT_H
#define BOARD_IDENT_EXPORT_H

#ifdef _WIN32
#ifdef board_ident_core_EXPORTS
#define BOARD_IDENT_API __declspec(dllexport)
#else
#define BOARD_IDENT_API __declspec(dllimport)
#endif
#else
#define BOARD_IDENT_API
#endif

#endif // BOARD_IDENT_EXPORT_H
