#pragma once
#include "AppConfig.hpp"
#include "AutomationObject.hpp"
#include "CardStrategies.hpp"
#include "NativeApi.hpp"
#include <QLibrary>
#include <QString>
#include <QStringList>
#include <memory>
#include <vector>

namespace nhilabel {

// Whatever the orchestrator reads through: a bound library and the strategies it supports.
class ReaderBackend {
public:
    virtual ~ReaderBackend() = default;
    virtual QString describe() const = 0;
    virtual std::vector<CardAcquisitionStrategy*> strategies() = 0;
    // Close ports / release handles after a read. May throw; the caller absorbs it.
    virtual void release() = 0;
};

// Switches the process working directory for the lifetime of the guard.
class ScopedWorkingDirectory {
public:
    explicit ScopedWorkingDirectory(const QString& dir);
    ~ScopedWorkingDirectory();
    ScopedWorkingDirectory(const ScopedWorkingDirectory&) = delete;
    ScopedWorkingDirectory& operator=(const ScopedWorkingDirectory&) = delete;
    bool changed() const { return changed_; }
private:
    QString saved_;
    bool changed_ = false;
};

struct CandidateSources {
    QString configPath;
    QString envVar = "NHI_CARD_DLL_PATH";
    QStringList standardPaths;
    QString bundledDir;
    QStringList bundledNames;

    // Platform install locations plus <applicationDir>/drivers.
    static CandidateSources defaults(const QString& configPath, const QString& applicationDir);
};

struct ResolvedPath {
    QString path;
    bool exists = false;
    QStringList checked;
};

class BoundLibrary final : public ReaderBackend {
public:
    enum class Kind { Native, Automation };

    // Flat C ABI library.
    BoundLibrary(QString path, std::unique_ptr<QLibrary> lib, NativeApi api, const ReaderOptions& opt);
    // Managed component reached through automation.
    BoundLibrary(QString path, std::unique_ptr<AutomationObject> obj, const ReaderOptions& opt);
    ~BoundLibrary() override;

    QString describe() const override;
    std::vector<CardAcquisitionStrategy*> strategies() override;
    // Closes the port a read opened, otherwise NHI_Release. Throws AcquisitionError.
    void release() override;

    Kind kind() const { return kind_; }
    const QString& path() const { return path_; }
    const Capabilities& capabilities() const { return caps_; }
    const NativeApi& api() const { return api_; }

private:
    void buildStrategies(const ReaderOptions& opt);

    Kind kind_;
    QString path_;
    std::unique_ptr<QLibrary> lib_;
    std::unique_ptr<AutomationObject> automation_;
    NativeApi api_;
    Capabilities caps_;
    std::vector<std::unique_ptr<CardAcquisitionStrategy>> strategies_;
    SimpleReadStrategy* simpleRead_ = nullptr;
};

// Standalone mode: nothing is bound, every read ends in manual entry.
class OfflineBackend final : public ReaderBackend {
public:
    explicit OfflineBackend(const QString& reason);
    QString describe() const override;
    std::vector<CardAcquisitionStrategy*> strategies() override;
    void release() override {}
private:
    OfflineStrategy strategy_;
};

class NativeLibraryBinder {
public:
    static constexpr const char* kAutomationProgId = "NhiCard.Patient";

    NativeLibraryBinder(ReaderOptions options, CandidateSources sources,
                        AutomationFactory automation = defaultAutomationFactory());

    // explicit > config > environment > standard > bundled; first existing wins.
    ResolvedPath resolvePath(const QString& explicitPath = {}) const;

    // Throws NativeLibraryError.
    std::unique_ptr<BoundLibrary> bind(const QString& explicitPath = {}) const;

    static bool isManagedComponent(const QString& path);

private:
    std::unique_ptr<BoundLibrary> bindAutomation(const ResolvedPath& rp) const;
    std::unique_ptr<BoundLibrary> bindNative(const ResolvedPath& rp) const;

    ReaderOptions options_;
    CandidateSources sources_;
    AutomationFactory automation_;
};

} // namespace nhilabel
