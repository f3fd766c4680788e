#ifndef NHIREADERAPI_H
#define NHIREADERAPI_H
#pragma once

#if defined(_WIN32)
#define NHIREADER_API __declspec(dllexport)
#define NHIREADER_CALL __stdcall
#else
#define NHIREADER_API __attribute__((visibility("default")))
#define NHIREADER_CALL
#endif

// Vendor return codes. 0 is success.
#define NHIREADER_OK            0
#define NHIREADER_ERR_TIMEOUT   4000
#define NHIREADER_ERR_PORT      4001
#define NHIREADER_ERR_NO_CARD   4013
#define NHIREADER_ERR_NOT_NHI   4033
#define NHIREADER_ERR_ARGUMENT  4999

#define NHIREADER_BASIC_DATA_SIZE 72

#ifdef __cplusplus
extern "C" {
#endif

// Fills `buffer` with the 72-byte basic-data record; *length holds the capacity on entry
// and the number of bytes written on return.
NHIREADER_API int NHIREADER_CALL hisGetBasicData(char* buffer, int* length);

// The USB reader has no COM port; `port` is accepted for compatibility and logged.
NHIREADER_API int NHIREADER_CALL csOpenCom(int port);
NHIREADER_API int NHIREADER_CALL csCloseCom(void);

// Writes "ID|NAME|BIRTH|SEX|CARDNO" (name in Big5) to `buffer`, NUL terminated.
// The caller provides at least 256 bytes.
NHIREADER_API int NHIREADER_CALL csReadCard(char* buffer);

NHIREADER_API const char* nhireader_version(void);

#ifdef __cplusplus
}
#endif

#endif // NHIREADERAPI_H
