#ifndef OSCQUERY_SERVER_EXPORT_H
#define OSCQUERY_SERVER_EXPORT_H

#ifdef _WIN32
#ifdef oscquery_server_core_EXPORTS
#define OSCQUERY_SERVER_API __declspec(dllexport)
#else
#define OSCQUERY_SERVER_API __declspec(dllimport)
#endif
#else
#define OSCQUERY_SERVER_API
#endif

#endif // OSCQUERY_SERVER_EXPORT_H
