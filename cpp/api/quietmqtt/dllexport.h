#ifndef QUIETMQTT_DLLEXPORT_H_
#define QUIETMQTT_DLLEXPORT_H_

#if defined(_WIN32)
#if defined(QUIETMQTT_BUILDING_LIBRARY)
#define QUIETMQTT_DLLEXPORT __declspec(dllexport)
#else
#define QUIETMQTT_DLLEXPORT __declspec(dllimport)
#endif
#else
#define QUIETMQTT_DLLEXPORT __attribute__((visibility("default")))
#endif

#endif // QUIETMQTT_DLLEXPORT_H_
