#include "AcquisitionOrchestrator.hpp"
#include "Logging.hpp"
#include <QStringList>
#include <future>

namespace nhilabel {
namespace {

AcquisitionFailure makeFailure(ErrorCategory c, const QString& msg, const QString& context,
                               const QStringList& paths = {}){
    AcquisitionFailure f;
    f.category = c;
    f.message = msg;
    f.context = context;
    f.remediation = remediationText(c, paths);
    return f;
}

// Runs release() once when the read is over, whatever happened before.
class ReleaseGuard {
public:
    explicit ReleaseGuard(ReaderBackend& b) : b_(b) {}
    ~ReleaseGuard(){
        try {
            b_.release();
        } catch (const std::exception& ex) {
            qCWarning(lcAcquisition) << "Releasing reader resources failed:" << ex.what();
        }
    }
    ReleaseGuard(const ReleaseGuard&) = delete;
    ReleaseGuard& operator=(const ReleaseGuard&) = delete;
private:
    ReaderBackend& b_;
};

} // namespace

BackendFactory makeBackendFactory(const ReaderOptions& options, const CandidateSources& sources,
                                  AutomationFactory automation){
    return [options, sources, automation](const QString& explicitPath) -> std::unique_ptr<ReaderBackend> {
        if (options.standalone)
            return std::make_unique<OfflineBackend>("standalone mode is configured");
        NativeLibraryBinder binder(options, sources, automation);
        return binder.bind(explicitPath);
    };
}

AcquisitionOrchestrator::AcquisitionOrchestrator(BackendFactory factory, CardDataDecoder decoder,
                                                 std::mutex& deviceLock, QString explicitPath)
    : factory_(std::move(factory)), decoder_(std::move(decoder)), deviceLock_(deviceLock),
      explicitPath_(std::move(explicitPath)) {
    std::lock_guard<std::mutex> lk(queueMutex_);
    reader_ = std::thread([this]{ readerLoop(); });
    readerId_ = reader_.get_id();
}

AcquisitionOrchestrator::~AcquisitionOrchestrator(){
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        stopping_ = true;
    }
    queueCv_.notify_all();
    if (reader_.joinable()) reader_.join();
}

void AcquisitionOrchestrator::readerLoop(){
    AutomationApartment apartment;
    for (;;){
        Task task;
        {
            std::unique_lock<std::mutex> lk(queueMutex_);
            queueCv_.wait(lk, [this]{ return stopping_ || !queue_.empty(); });
            if (queue_.empty()) break;   // stopping, nothing left to run
            task = std::move(queue_.front());
            queue_.pop_front();
            running_ = true;
        }
        task();
        {
            std::lock_guard<std::mutex> lk(queueMutex_);
            running_ = false;
        }
        idleCv_.notify_all();
    }

    // The backend goes away inside the apartment it was created in.
    std::lock_guard<std::mutex> lock(deviceLock_);
    backend_.reset();
}

void AcquisitionOrchestrator::post(Task task){
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        queue_.push_back(std::move(task));
    }
    queueCv_.notify_one();
}

void AcquisitionOrchestrator::runOnReader(const Task& task){
    if (onReader()){
        task();
        return;
    }
    std::promise<void> done;
    post([&task, &done]{
        try {
            task();
            done.set_value();
        } catch (...) {
            done.set_exception(std::current_exception());
        }
    });
    done.get_future().get();
}

void AcquisitionOrchestrator::wait(){
    if (onReader()) return;
    std::unique_lock<std::mutex> lk(queueMutex_);
    idleCv_.wait(lk, [this]{ return queue_.empty() && !running_; });
}

AcquisitionFailure AcquisitionOrchestrator::busyFailure(){
    return makeFailure(ErrorCategory::Busy, "A card read is already in progress", "busy");
}

void AcquisitionOrchestrator::startAcquisition(SuccessFn onSuccess, FailureFn onFailure){
    bool expected = false;
    if (!reading_.compare_exchange_strong(expected, true)){
        qCInfo(lcAcquisition) << "Read request rejected, another read is in flight";
        if (onFailure) onFailure(busyFailure());
        return;
    }

    post([this, onSuccess = std::move(onSuccess), onFailure = std::move(onFailure)]{
        AcquisitionResult r = run();
        try {
            if (r.ok()) { if (onSuccess) onSuccess(r.record()); }
            else if (onFailure) onFailure(r.failure());
        } catch (const std::exception& ex) {
            qCCritical(lcAcquisition) << "Acquisition callback threw:" << ex.what();
        }
        reading_.store(false);
    });
}

AcquisitionResult AcquisitionOrchestrator::acquire(){
    bool expected = false;
    if (!reading_.compare_exchange_strong(expected, true))
        return AcquisitionResult::failure(busyFailure());

    AcquisitionResult r;
    try {
        runOnReader([this, &r]{ r = run(); });
    } catch (...) {
        reading_.store(false);
        throw;
    }
    reading_.store(false);
    return r;
}

void AcquisitionOrchestrator::rebind(const QString& explicitPath){
    runOnReader([this, &explicitPath]{
        std::lock_guard<std::mutex> lock(deviceLock_);
        std::unique_ptr<ReaderBackend> fresh = factory_(explicitPath);
        const QString desc = fresh->describe();
        backend_ = std::move(fresh);
        explicitPath_ = explicitPath;
        {
            std::lock_guard<std::mutex> lk(infoMutex_);
            description_ = desc;
        }
        qCInfo(lcAcquisition) << "Rebound card reader:" << desc;
    });
}

QString AcquisitionOrchestrator::backendDescription() const {
    std::lock_guard<std::mutex> lk(infoMutex_);
    return description_;
}

ReaderBackend& AcquisitionOrchestrator::backend(){
    if (!backend_){
        backend_ = factory_(explicitPath_);
        std::lock_guard<std::mutex> lk(infoMutex_);
        description_ = backend_->describe();
    }
    return *backend_;
}

StrategyResult AcquisitionOrchestrator::runStrategy(CardAcquisitionStrategy& s){
    try {
        return s.acquire();
    } catch (const NhiError& ex) {
        return StrategyResult::failure(ex.category(), ex.message());
    } catch (const std::exception& ex) {
        return StrategyResult::failure(ErrorCategory::DeviceCallFailed,
                                       QString("%1 raised: %2").arg(s.name(), QString::fromLocal8Bit(ex.what())));
    }
}

AcquisitionResult AcquisitionOrchestrator::run(){
    std::lock_guard<std::mutex> lock(deviceLock_);

    ReaderBackend* b = nullptr;
    try {
        b = &backend();
    } catch (const NativeLibraryError& ex) {
        qCCritical(lcAcquisition) << "Binding failed:" << ex.what();
        return AcquisitionResult::failure(makeFailure(ex.category(), ex.message(),
                                                      "path=" + ex.path(), ex.checkedPaths()));
    } catch (const std::exception& ex) {
        qCCritical(lcAcquisition) << "Binding failed:" << ex.what();
        return AcquisitionResult::failure(makeFailure(ErrorCategory::BindingFailed,
                                                      QString::fromLocal8Bit(ex.what()), "bind"));
    }

    ReleaseGuard release(*b);
    std::optional<RawCardData> raw;
    std::optional<StrategyResult> lastError;
    QStringList attempts;

    for (CardAcquisitionStrategy* s : b->strategies()){
        qCInfo(lcAcquisition) << "Trying strategy" << s->name();
        StrategyResult r = runStrategy(*s);
        if (r.ok()){
            raw = r.data();
            break;
        }
        attempts << QString("%1: %2").arg(s->name(), r.message());
        qCWarning(lcAcquisition) << "Strategy" << s->name() << "failed"
                                 << categoryName(r.category()) << "code" << r.code() << "-" << r.message();
        if (s->terminal()){
            if (!lastError) lastError = r;
            break;
        }
        lastError = r;
    }

    if (!raw){
        if (!lastError)
            return AcquisitionResult::failure(makeFailure(ErrorCategory::ConfigurationAbsent,
                "No card reading method is available", b->describe()));
        return AcquisitionResult::failure(makeFailure(lastError->category(), lastError->message(),
                                                      b->describe() + "; " + attempts.join("; ")));
    }

    CardFields fields = raw->fields;
    if (raw->format != BlobFormat::None){
        try {
            fields = decoder_.decode(raw->blob, raw->format);
        } catch (const DecodeError& ex) {
            qCWarning(lcAcquisition) << "Decoding" << raw->strategy << "data failed:" << ex.what()
                                     << "raw:" << raw->blob.toHex(' ');
            return AcquisitionResult::failure(makeFailure(ErrorCategory::DecodeFailed, ex.message(),
                                                          "strategy=" + raw->strategy));
        }
    }

    try {
        PatientRecord rec = PatientRecord::fromFields(fields, raw->blob, raw->strategy);
        qCInfo(lcAcquisition) << "Card read via" << raw->strategy << "ID" << rec.idNumber();
        return AcquisitionResult::success(std::move(rec));
    } catch (const ValidationError& ex) {
        qCWarning(lcAcquisition) << "Card data incomplete:" << ex.what();
        return AcquisitionResult::failure(makeFailure(ErrorCategory::ValidationFailed, ex.message(),
                                                      "strategy=" + raw->strategy));
    }
}

} // namespace nhilabel
