#pragma once
#include <QStringList>

#if defined(_WIN32)
#define NHILABEL_CALL __stdcall
#else
#define NHILABEL_CALL
#endif

namespace nhilabel {

// Entry points of the vendor C ABI. Any of them may be absent from a given installation.
struct NativeApi {
    using GetBasicDataFn = int  (NHILABEL_CALL *)(char* buffer, int* length);
    using OpenComFn      = int  (NHILABEL_CALL *)(int port);
    using CloseComFn     = int  (NHILABEL_CALL *)();
    using ReadCardFn     = int  (NHILABEL_CALL *)(char* buffer);
    using BoolFn         = bool (NHILABEL_CALL *)();
    using GetFieldFn     = bool (NHILABEL_CALL *)(char* buffer, int size);
    using LastErrorFn    = int  (NHILABEL_CALL *)(char* buffer, int size);

    GetBasicDataFn hisGetBasicData = nullptr;
    OpenComFn      csOpenCom = nullptr;
    CloseComFn     csCloseCom = nullptr;
    ReadCardFn     csReadCard = nullptr;

    BoolFn         nhiInitialize = nullptr;
    BoolFn         nhiReadCard = nullptr;
    GetFieldFn     nhiGetId = nullptr;
    GetFieldFn     nhiGetName = nullptr;
    GetFieldFn     nhiGetBirthDate = nullptr;
    LastErrorFn    nhiGetLastError = nullptr;
    BoolFn         nhiRelease = nullptr;
};

struct Capabilities {
    bool basicData = false;     // hisGetBasicData
    bool simpleRead = false;    // csReadCard
    bool legacyFields = false;  // NHI_GetID + NHI_GetName
    bool automation = false;    // NhiCard.Patient object
    bool portControl = false;   // csOpenCom / csCloseCom

    bool any() const { return basicData || simpleRead || legacyFields || automation; }
    QStringList describe() const;
};

Capabilities probeCapabilities(const NativeApi& api);

} // namespace nhilabel
