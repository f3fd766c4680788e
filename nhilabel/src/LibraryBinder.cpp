#include "LibraryBinder.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include <QDir>
#include <QFileInfo>

namespace nhilabel {

QStringList Capabilities::describe() const {
    QStringList s;
    if (basicData) s << "hisGetBasicData";
    if (simpleRead) s << "csReadCard";
    if (legacyFields) s << "NHI_Get*";
    if (automation) s << "NhiCard.Patient";
    if (portControl) s << "csOpenCom/csCloseCom";
    return s;
}

Capabilities probeCapabilities(const NativeApi& api){
    Capabilities c;
    c.basicData = api.hisGetBasicData != nullptr;
    c.simpleRead = api.csReadCard != nullptr;
    c.legacyFields = api.nhiGetId != nullptr && api.nhiGetName != nullptr;
    c.portControl = api.csOpenCom != nullptr || api.csCloseCom != nullptr;
    return c;
}

ScopedWorkingDirectory::ScopedWorkingDirectory(const QString& dir) : saved_(QDir::currentPath()) {
    if (!dir.isEmpty() && QDir(dir).exists()) changed_ = QDir::setCurrent(dir);
}

ScopedWorkingDirectory::~ScopedWorkingDirectory(){
    if (changed_ && !QDir::setCurrent(saved_))
        qCWarning(lcBinder) << "Could not restore working directory" << saved_;
}

CandidateSources CandidateSources::defaults(const QString& configPath, const QString& applicationDir){
    CandidateSources s;
    s.configPath = configPath;
#if defined(Q_OS_WIN)
    s.standardPaths = {
        "C:\\NHI\\LIB\\CsHis50.dll",
        "C:\\NHI\\LIB\\csHis50.dll",
        "C:\\NHI\\LIB\\CSHIS.dll",
        "C:\\Program Files\\NHI\\LIB\\CsHis50.dll",
        "C:\\Program Files (x86)\\NHI\\LIB\\CsHis50.dll",
        "C:\\GNT\\HenCs\\NhiCard.dll",
        "C:\\Program Files\\GNT\\NhiCard.dll",
        "C:\\Program Files (x86)\\GNT\\NhiCard.dll",
    };
    s.bundledNames = { "CsHis50.dll", "NhiCard.dll" };
#else
    s.standardPaths = {
        "/opt/nhi/lib/libcshis50.so",
        "/opt/NHI/lib/libCsHis50.so",
        "/opt/nhi/lib/libcshis.so",
        "/usr/local/lib/libcshis50.so",
        "/usr/lib/libcshis50.so",
    };
    s.bundledNames = { "libnhireader.so", "libcshis50.so" };
#endif
    if (!applicationDir.isEmpty()) s.bundledDir = QDir(applicationDir).filePath("drivers");
    return s;
}

// ---------------------------------------------------------------------------

BoundLibrary::BoundLibrary(QString path, std::unique_ptr<QLibrary> lib, NativeApi api, const ReaderOptions& opt)
    : kind_(Kind::Native), path_(std::move(path)), lib_(std::move(lib)), api_(api), caps_(probeCapabilities(api)) {
    buildStrategies(opt);
}

BoundLibrary::BoundLibrary(QString path, std::unique_ptr<AutomationObject> obj, const ReaderOptions& opt)
    : kind_(Kind::Automation), path_(std::move(path)), automation_(std::move(obj)) {
    caps_.automation = true;
    buildStrategies(opt);
}

BoundLibrary::~BoundLibrary(){
    strategies_.clear();
    automation_.reset();
    if (lib_ && lib_->isLoaded()) lib_->unload();
}

void BoundLibrary::buildStrategies(const ReaderOptions& opt){
    VendorErrorTable errors;
    errors.merge(opt.vendorErrors);

    if (caps_.basicData) strategies_.push_back(std::make_unique<BasicDataStrategy>(api_, opt.basicData, errors));
    if (caps_.simpleRead){
        auto simple = std::make_unique<SimpleReadStrategy>(api_, opt.comPort, errors);
        simpleRead_ = simple.get();
        strategies_.push_back(std::move(simple));
    }
    if (caps_.legacyFields) strategies_.push_back(std::make_unique<LegacyFieldsStrategy>(api_));
    if (caps_.automation && automation_) strategies_.push_back(std::make_unique<AutomationStrategy>(*automation_));
    if (strategies_.empty())
        strategies_.push_back(std::make_unique<OfflineStrategy>(
            QString("%1 exports no known card-reading entry point").arg(QFileInfo(path_).fileName())));
}

QString BoundLibrary::describe() const {
    const QStringList caps = caps_.describe();
    return QString("%1 [%2: %3]")
        .arg(path_, kind_==Kind::Native ? "native" : "automation",
             caps.isEmpty() ? "no known entry points" : caps.join(", "));
}

std::vector<CardAcquisitionStrategy*> BoundLibrary::strategies(){
    std::vector<CardAcquisitionStrategy*> out;
    out.reserve(strategies_.size());
    for (auto& s : strategies_) out.push_back(s.get());
    return out;
}

void BoundLibrary::release(){
    if (kind_==Kind::Automation){
        if (automation_ && automation_->hasMember("Close")) automation_->call("Close");
        return;
    }
    if (api_.csCloseCom && simpleRead_ && simpleRead_->portOpen()){
        simpleRead_->portClosed();
        const int rc = api_.csCloseCom();
        if (rc != 0) throw AcquisitionError(ErrorCategory::DeviceCallFailed,
                                            QString("csCloseCom returned %1").arg(rc), rc);
        qCDebug(lcBinder) << "Reader port closed";
        return;
    }
    if (api_.nhiRelease && !api_.nhiRelease())
        qCWarning(lcBinder) << "NHI_Release reported failure";
}

// ---------------------------------------------------------------------------

namespace {

template <typename Fn>
Fn resolveAs(QLibrary& lib, const char* symbol){
    return reinterpret_cast<Fn>(lib.resolve(symbol));
}

} // namespace

NativeLibraryBinder::NativeLibraryBinder(ReaderOptions options, CandidateSources sources, AutomationFactory automation)
    : options_(std::move(options)), sources_(std::move(sources)), automation_(std::move(automation)) {}

bool NativeLibraryBinder::isManagedComponent(const QString& path){
    return QFileInfo(path).fileName().compare("NhiCard.dll", Qt::CaseInsensitive) == 0;
}

ResolvedPath NativeLibraryBinder::resolvePath(const QString& explicitPath) const {
    ResolvedPath r;
    auto hit = [&r](const QString& candidate, const char* source) -> bool {
        if (candidate.trimmed().isEmpty()) return false;
        r.checked << candidate;
        if (!QFileInfo(candidate).isFile()) return false;
        r.path = candidate;
        r.exists = true;
        qCInfo(lcBinder) << "Card reader library from" << source << ":" << candidate;
        return true;
    };

    if (hit(explicitPath, "caller")) return r;
    if (hit(sources_.configPath, "configuration")) return r;
    if (!sources_.envVar.isEmpty() && hit(qEnvironmentVariable(sources_.envVar.toLatin1().constData()), "environment")) return r;
    for (const auto& p : sources_.standardPaths) if (hit(p, "standard location")) return r;
    if (!sources_.bundledDir.isEmpty())
        for (const auto& n : sources_.bundledNames) if (hit(QDir(sources_.bundledDir).filePath(n), "bundled drivers")) return r;

    r.path = sources_.standardPaths.value(0, r.checked.value(0));
    qCWarning(lcBinder) << "No card reader library found, expected" << r.path;
    return r;
}

std::unique_ptr<BoundLibrary> NativeLibraryBinder::bind(const QString& explicitPath) const {
    const ResolvedPath rp = resolvePath(explicitPath);
    if (!rp.exists)
        throw NativeLibraryError(ErrorCategory::ConfigurationAbsent, rp.path, "file not found", rp.checked);
    if (isManagedComponent(rp.path)) return bindAutomation(rp);
    return bindNative(rp);
}

std::unique_ptr<BoundLibrary> NativeLibraryBinder::bindAutomation(const ResolvedPath& rp) const {
    qCInfo(lcBinder) << rp.path << "is a managed component, binding through automation";
    if (!automation_)
        throw NativeLibraryError(ErrorCategory::BindingUnsupported, rp.path,
                                 "the driver requires COM support, which this host does not provide", rp.checked);

    ScopedWorkingDirectory cwd(QFileInfo(rp.path).absolutePath());
    QString err;
    auto obj = automation_(kAutomationProgId, &err);
    if (!obj) throw NativeLibraryError(ErrorCategory::BindingFailed, rp.path, err, rp.checked);
    return std::make_unique<BoundLibrary>(rp.path, std::move(obj), options_);
}

std::unique_ptr<BoundLibrary> NativeLibraryBinder::bindNative(const ResolvedPath& rp) const {
    const QFileInfo fi(rp.path);
    ScopedWorkingDirectory cwd(fi.absolutePath());

    auto lib = std::make_unique<QLibrary>(fi.absoluteFilePath());
    if (!lib->load()){
        qCCritical(lcBinder) << "Loading" << rp.path << "failed:" << lib->errorString();
        throw NativeLibraryError(ErrorCategory::BindingFailed, rp.path, lib->errorString(), rp.checked);
    }

    NativeApi api;
    api.hisGetBasicData = resolveAs<NativeApi::GetBasicDataFn>(*lib, "hisGetBasicData");
    api.csOpenCom       = resolveAs<NativeApi::OpenComFn>(*lib, "csOpenCom");
    api.csCloseCom      = resolveAs<NativeApi::CloseComFn>(*lib, "csCloseCom");
    api.csReadCard      = resolveAs<NativeApi::ReadCardFn>(*lib, "csReadCard");
    api.nhiInitialize   = resolveAs<NativeApi::BoolFn>(*lib, "NHI_Initialize");
    api.nhiReadCard     = resolveAs<NativeApi::BoolFn>(*lib, "NHI_ReadCard");
    api.nhiGetId        = resolveAs<NativeApi::GetFieldFn>(*lib, "NHI_GetID");
    api.nhiGetName      = resolveAs<NativeApi::GetFieldFn>(*lib, "NHI_GetName");
    api.nhiGetBirthDate = resolveAs<NativeApi::GetFieldFn>(*lib, "NHI_GetBirthDate");
    api.nhiGetLastError = resolveAs<NativeApi::LastErrorFn>(*lib, "NHI_GetLastError");
    api.nhiRelease      = resolveAs<NativeApi::BoolFn>(*lib, "NHI_Release");

    auto bound = std::make_unique<BoundLibrary>(rp.path, std::move(lib), api, options_);
    qCInfo(lcBinder) << "Bound" << bound->describe();
    return bound;
}

// ---------------------------------------------------------------------------

OfflineBackend::OfflineBackend(const QString& reason) : strategy_(reason) {}

QString OfflineBackend::describe() const { return "offline (manual entry)"; }

std::vector<CardAcquisitionStrategy*> OfflineBackend::strategies(){ return { &strategy_ }; }

} // namespace nhilabel
