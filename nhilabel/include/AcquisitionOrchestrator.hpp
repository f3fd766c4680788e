#pragma once
#include "CardDecoder.hpp"
#include "Errors.hpp"
#include "LibraryBinder.hpp"
#include "PatientRecord.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace nhilabel {

class AcquisitionResult {
public:
    static AcquisitionResult success(PatientRecord r){ AcquisitionResult a; a.record_ = std::move(r); return a; }
    static AcquisitionResult failure(AcquisitionFailure f){ AcquisitionResult a; a.failure_ = std::move(f); return a; }

    bool ok() const { return record_.has_value(); }
    const PatientRecord& record() const { return *record_; }
    const AcquisitionFailure& failure() const { return failure_; }

private:
    std::optional<PatientRecord> record_;
    AcquisitionFailure failure_;
};

// Produces the backend on first use or on rebind. Throws NativeLibraryError.
using BackendFactory = std::function<std::unique_ptr<ReaderBackend>(const QString& explicitPath)>;

// Binder-backed factory; standalone mode yields an OfflineBackend.
BackendFactory makeBackendFactory(const ReaderOptions& options, const CandidateSources& sources,
                                  AutomationFactory automation = defaultAutomationFactory());

class AcquisitionOrchestrator {
public:
    enum class State { Idle, Reading };
    using SuccessFn = std::function<void(const PatientRecord&)>;
    using FailureFn = std::function<void(const AcquisitionFailure&)>;

    // `deviceLock` serializes every call into the vendor driver, including rebinds.
    // The backend lives on one reader thread, which runs every bind, read and release.
    AcquisitionOrchestrator(BackendFactory factory, CardDataDecoder decoder, std::mutex& deviceLock,
                            QString explicitPath = {});
    ~AcquisitionOrchestrator();

    AcquisitionOrchestrator(const AcquisitionOrchestrator&) = delete;
    AcquisitionOrchestrator& operator=(const AcquisitionOrchestrator&) = delete;

    // Queued to the reader thread; exactly one callback fires there. A call made while
    // a read is in flight gets Busy through its own onFailure, synchronously.
    void startAcquisition(SuccessFn onSuccess, FailureFn onFailure);

    // Same pipeline, blocking the caller until the reader thread is done.
    AcquisitionResult acquire();

    // Replaces the bound backend; the old one stays if binding fails. Throws NativeLibraryError.
    void rebind(const QString& explicitPath = {});

    State state() const { return reading_.load() ? State::Reading : State::Idle; }
    QString backendDescription() const;

    // Blocks until every queued request has finished.
    void wait();

private:
    using Task = std::function<void()>;

    void post(Task task);
    // Runs `task` on the reader thread and rethrows what it threw; inline when already there.
    void runOnReader(const Task& task);
    void readerLoop();
    bool onReader() const { return std::this_thread::get_id() == readerId_; }

    AcquisitionResult run();
    ReaderBackend& backend();
    StrategyResult runStrategy(CardAcquisitionStrategy& s);
    static AcquisitionFailure busyFailure();

    BackendFactory factory_;
    CardDataDecoder decoder_;
    std::mutex& deviceLock_;
    QString explicitPath_;
    std::unique_ptr<ReaderBackend> backend_;   // reader thread only

    mutable std::mutex infoMutex_;
    QString description_;

    std::atomic<bool> reading_{false};

    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::condition_variable idleCv_;
    std::deque<Task> queue_;
    bool running_ = false;
    bool stopping_ = false;
    std::thread::id readerId_;
    std::thread reader_;
};

} // namespace nhilabel
