#include "AcquisitionOrchestrator.hpp"
#include "TestSupport.hpp"

#include <QLibrary>
#include <QTemporaryDir>
#include <atomic>
#include <condition_variable>
#include <future>
#include <set>
#include <thread>
#include <gtest/gtest.h>

using namespace nhilabel;

namespace {

QString u(const char* s){ return QString::fromUtf8(s); }

RawCardData textData(const QString& text){
    RawCardData d;
    d.format = BlobFormat::Text;
    d.blob = text.toUtf8();
    d.strategy = "fake";
    return d;
}

RawCardData fieldData(const QString& id, const QString& name){
    RawCardData d;
    d.format = BlobFormat::None;
    d.fields.idNumber = id;
    d.fields.fullName = name;
    d.strategy = "fake";
    return d;
}

class FakeStrategy : public CardAcquisitionStrategy {
public:
    using Fn = std::function<StrategyResult()>;
    FakeStrategy(QString name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}
    QString name() const override { return name_; }
    StrategyResult acquire() override { ++calls; return fn_(); }
    int calls = 0;
private:
    QString name_;
    Fn fn_;
};

struct BackendTrace {
    std::atomic<int> releases{0};
    bool releaseThrows = false;
    std::thread::id releasedOn;
    std::thread::id destroyedOn;
};

class FakeBackend : public ReaderBackend {
public:
    FakeBackend(BackendTrace& trace, std::vector<std::unique_ptr<CardAcquisitionStrategy>> s)
        : trace_(trace), strategies_(std::move(s)) {}
    ~FakeBackend() override { trace_.destroyedOn = std::this_thread::get_id(); }
    QString describe() const override { return "fake backend"; }
    std::vector<CardAcquisitionStrategy*> strategies() override {
        std::vector<CardAcquisitionStrategy*> out;
        for (auto& s : strategies_) out.push_back(s.get());
        return out;
    }
    void release() override {
        ++trace_.releases;
        trace_.releasedOn = std::this_thread::get_id();
        if (trace_.releaseThrows) throw AcquisitionError(ErrorCategory::DeviceCallFailed, "close failed", 4001);
    }
private:
    BackendTrace& trace_;
    std::vector<std::unique_ptr<CardAcquisitionStrategy>> strategies_;
};

BackendFactory factoryOf(BackendTrace& trace, std::vector<FakeStrategy::Fn> fns){
    return [&trace, fns](const QString&) -> std::unique_ptr<ReaderBackend> {
        std::vector<std::unique_ptr<CardAcquisitionStrategy>> s;
        int i = 0;
        for (const auto& fn : fns) s.push_back(std::make_unique<FakeStrategy>(QString("s%1").arg(i++), fn));
        return std::make_unique<FakeBackend>(trace, std::move(s));
    };
}

StrategyResult ok(const QString& text){ return StrategyResult::success(textData(text)); }
StrategyResult fail(const QString& msg){ return StrategyResult::failure(ErrorCategory::DeviceCallFailed, msg, 4013); }

const QString kGood = u("A123456789|王小明|0750101|M");

ReaderOptions noDelay(){
    ReaderOptions opt;
    opt.basicData.preSettleMs = 0;
    opt.basicData.postSettleMs = 0;
    return opt;
}

class AcquisitionOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir_.isValid());
        qputenv("FAKE_CSHIS_BLOB", blobFile().toLocal8Bit());
        qunsetenv("FAKE_CSHIS_RC");
        qunsetenv("FAKE_CSHIS_BASIC_RC");
    }
    void TearDown() override
    {
        qunsetenv("FAKE_CSHIS_BLOB");
        qunsetenv("FAKE_CSHIS_RC");
        qunsetenv("FAKE_CSHIS_BASIC_RC");
    }

    QString blobFile() const { return dir_.filePath("card.bin"); }

    void writeCard(const QString& cardNo, const QString& name, const QString& id)
    {
        nhilabel::test::writeFile(blobFile(), nhilabel::test::basicDataBlob(cardNo, name, id, "0750101", "M"));
    }

    // csCloseCom calls seen by the fake vendor library so far.
    int closeCount()
    {
        if (!fakeLib_.isLoaded()){
            fakeLib_.setFileName(FAKE_CSHIS_PATH);
            EXPECT_TRUE(fakeLib_.load()) << fakeLib_.errorString().toStdString();
        }
        using CountFn = int (*)();
        auto fn = reinterpret_cast<CountFn>(fakeLib_.resolve("fake_cshis_close_count"));
        return fn ? fn() : -1;
    }

    BackendFactory vendorFactory() const
    {
        CandidateSources src;
        src.envVar.clear();
        return makeBackendFactory(noDelay(), src, AutomationFactory());
    }

    std::mutex deviceLock_;
    BackendTrace trace_;
    QTemporaryDir dir_;
    QLibrary fakeLib_;
};

} // anonymous namespace

TEST_F(AcquisitionOrchestratorTest, Acquire_FirstStrategySucceeds_ReturnsRecord)
{
    AcquisitionOrchestrator o(factoryOf(trace_, {[]{ return ok(kGood); }}), CardDataDecoder(), deviceLock_);
    const AcquisitionResult r = o.acquire();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.record().idNumber(), "A123456789");
    EXPECT_EQ(r.record().fullName(), u("王小明"));
    EXPECT_EQ(trace_.releases, 1);
    EXPECT_EQ(o.backendDescription(), "fake backend");
}

TEST_F(AcquisitionOrchestratorTest, Acquire_FailingStrategy_FallsThroughToNext)
{
    AcquisitionOrchestrator o(factoryOf(trace_, {[]{ return fail("no card"); }, []{ return ok(kGood); }}),
                              CardDataDecoder(), deviceLock_);
    EXPECT_TRUE(o.acquire().ok());
}

TEST_F(AcquisitionOrchestratorTest, Acquire_AllFail_ReportsLastErrorWithAttempts)
{
    AcquisitionOrchestrator o(factoryOf(trace_, {[]{ return fail("first"); }, []{ return fail("second"); }}),
                              CardDataDecoder(), deviceLock_);
    const AcquisitionResult r = o.acquire();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.failure().category, ErrorCategory::DeviceCallFailed);
    EXPECT_EQ(r.failure().message, "second");
    EXPECT_TRUE(r.failure().context.contains("s0: first"));
    EXPECT_FALSE(r.failure().remediation.isEmpty());
}

TEST_F(AcquisitionOrchestratorTest, Acquire_StrategyThrows_CleanupRunsOnce)
{
    AcquisitionOrchestrator o(factoryOf(trace_, {[]() -> StrategyResult { throw std::runtime_error("driver crashed"); }}),
                              CardDataDecoder(), deviceLock_);
    const AcquisitionResult r = o.acquire();
    ASSERT_FALSE(r.ok());
    EXPECT_TRUE(r.failure().message.contains("driver crashed"));
    EXPECT_EQ(trace_.releases, 1);
}

TEST_F(AcquisitionOrchestratorTest, Acquire_CleanupThrows_ResultStillDelivered)
{
    trace_.releaseThrows = true;
    AcquisitionOrchestrator o(factoryOf(trace_, {[]{ return ok(kGood); }}), CardDataDecoder(), deviceLock_);
    const AcquisitionResult r = o.acquire();
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(trace_.releases, 1);
}

TEST_F(AcquisitionOrchestratorTest, Acquire_UndecodableData_DecodeFailed)
{
    AcquisitionOrchestrator o(factoryOf(trace_, {[]{ return ok("hello world"); }}), CardDataDecoder(), deviceLock_);
    const AcquisitionResult r = o.acquire();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.failure().category, ErrorCategory::DecodeFailed);
}

TEST_F(AcquisitionOrchestratorTest, Acquire_MissingName_ValidationFailed)
{
    AcquisitionOrchestrator o(factoryOf(trace_, {[]{ return StrategyResult::success(fieldData("A123456789", "")); }}),
                              CardDataDecoder(), deviceLock_);
    const AcquisitionResult r = o.acquire();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.failure().category, ErrorCategory::ValidationFailed);
}

TEST_F(AcquisitionOrchestratorTest, Acquire_OfflineBackend_AsksForManualEntry)
{
    BackendFactory f = [](const QString&) -> std::unique_ptr<ReaderBackend> {
        return std::make_unique<OfflineBackend>("standalone mode is configured");
    };
    AcquisitionOrchestrator o(f, CardDataDecoder(), deviceLock_);
    const AcquisitionResult r = o.acquire();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.failure().category, ErrorCategory::OfflinePlaceholder);
}

TEST_F(AcquisitionOrchestratorTest, Acquire_BindingFails_CarriesCheckedPaths)
{
    BackendFactory f = [](const QString&) -> std::unique_ptr<ReaderBackend> {
        throw NativeLibraryError(ErrorCategory::ConfigurationAbsent, "/opt/nhi/lib/libcshis50.so", "file not found",
                                 {"/opt/nhi/lib/libcshis50.so", "/usr/lib/libcshis50.so"});
    };
    AcquisitionOrchestrator o(f, CardDataDecoder(), deviceLock_);
    const AcquisitionResult r = o.acquire();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.failure().category, ErrorCategory::ConfigurationAbsent);
    EXPECT_TRUE(r.failure().remediation.contains("/usr/lib/libcshis50.so"));
}

TEST_F(AcquisitionOrchestratorTest, Acquire_BackendBoundOnceAndReused)
{
    int built = 0;
    BackendFactory inner = factoryOf(trace_, {[]{ return ok(kGood); }});
    BackendFactory f = [&built, inner](const QString& p){ ++built; return inner(p); };
    AcquisitionOrchestrator o(f, CardDataDecoder(), deviceLock_);
    o.acquire();
    o.acquire();
    EXPECT_EQ(built, 1);
    EXPECT_EQ(trace_.releases, 2);
}

TEST_F(AcquisitionOrchestratorTest, Rebind_FactoryThrows_KeepsPreviousBackend)
{
    bool broken = false;
    BackendFactory inner = factoryOf(trace_, {[]{ return ok(kGood); }});
    BackendFactory f = [&broken, inner](const QString& p) -> std::unique_ptr<ReaderBackend> {
        if (broken) throw NativeLibraryError(ErrorCategory::BindingFailed, p, "bad image");
        return inner(p);
    };
    AcquisitionOrchestrator o(f, CardDataDecoder(), deviceLock_);
    o.rebind();
    broken = true;
    EXPECT_THROW(o.rebind("/tmp/other.so"), NativeLibraryError);
    EXPECT_TRUE(o.acquire().ok());
}

TEST_F(AcquisitionOrchestratorTest, StartAcquisition_SecondRequestWhileReading_IsBusy)
{
    std::mutex m;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;

    BackendFactory f = factoryOf(trace_, {[&]{
        std::unique_lock<std::mutex> lk(m);
        entered = true;
        cv.notify_all();
        cv.wait(lk, [&]{ return released; });
        return ok(kGood);
    }});
    AcquisitionOrchestrator o(f, CardDataDecoder(), deviceLock_);

    std::promise<QString> first;
    o.startAcquisition([&](const PatientRecord& r){ first.set_value(r.idNumber()); },
                       [&](const AcquisitionFailure& e){ first.set_value("failed: " + e.message); });
    {
        std::unique_lock<std::mutex> lk(m);
        cv.wait(lk, [&]{ return entered; });
    }
    EXPECT_EQ(o.state(), AcquisitionOrchestrator::State::Reading);

    bool busy = false;
    bool secondSucceeded = false;
    o.startAcquisition([&](const PatientRecord&){ secondSucceeded = true; },
                       [&](const AcquisitionFailure& e){ busy = e.category==ErrorCategory::Busy; });
    EXPECT_TRUE(busy);
    EXPECT_FALSE(secondSucceeded);

    {
        std::lock_guard<std::mutex> lk(m);
        released = true;
    }
    cv.notify_all();
    EXPECT_EQ(first.get_future().get(), "A123456789");
    o.wait();
    EXPECT_EQ(o.state(), AcquisitionOrchestrator::State::Idle);
    EXPECT_EQ(trace_.releases, 1);
}

TEST_F(AcquisitionOrchestratorTest, StartAcquisition_ThrowingCallback_DoesNotWedgeState)
{
    AcquisitionOrchestrator o(factoryOf(trace_, {[]{ return ok(kGood); }}), CardDataDecoder(), deviceLock_);
    o.startAcquisition([](const PatientRecord&){ throw std::runtime_error("ui gone"); },
                       [](const AcquisitionFailure&){});
    o.wait();
    EXPECT_EQ(o.state(), AcquisitionOrchestrator::State::Idle);
    EXPECT_TRUE(o.acquire().ok());
}

// --- reader thread ---

TEST_F(AcquisitionOrchestratorTest, BackendWork_StaysOnOneReaderThread)
{
    std::mutex m;
    std::set<std::thread::id> seen;
    auto note = [&]{ std::lock_guard<std::mutex> lk(m); seen.insert(std::this_thread::get_id()); };

    BackendFactory inner = factoryOf(trace_, {[&]{ note(); return ok(kGood); }});
    BackendFactory f = [&note, inner](const QString& p){ note(); return inner(p); };
    {
        AcquisitionOrchestrator o(f, CardDataDecoder(), deviceLock_);
        o.rebind();
        ASSERT_TRUE(o.acquire().ok());

        std::promise<bool> done;
        o.startAcquisition([&](const PatientRecord&){ note(); done.set_value(true); },
                           [&](const AcquisitionFailure&){ done.set_value(false); });
        EXPECT_TRUE(done.get_future().get());
        o.wait();
        o.rebind();
        ASSERT_TRUE(o.acquire().ok());
    }

    ASSERT_EQ(seen.size(), 1u);
    const std::thread::id reader = *seen.begin();
    EXPECT_NE(reader, std::this_thread::get_id());
    EXPECT_EQ(trace_.releasedOn, reader);
    EXPECT_EQ(trace_.destroyedOn, reader);
}

TEST_F(AcquisitionOrchestratorTest, BackendWork_LazyBindHappensOnReaderThread)
{
    std::thread::id boundOn;
    BackendFactory inner = factoryOf(trace_, {[]{ return ok(kGood); }});
    BackendFactory f = [&boundOn, inner](const QString& p){ boundOn = std::this_thread::get_id(); return inner(p); };
    AcquisitionOrchestrator o(f, CardDataDecoder(), deviceLock_);
    ASSERT_TRUE(o.acquire().ok());
    EXPECT_NE(boundOn, std::this_thread::get_id());
    EXPECT_EQ(trace_.releasedOn, boundOn);
}

TEST_F(AcquisitionOrchestratorTest, StartAcquisition_CallbackRebinds_DoesNotDeadlock)
{
    int built = 0;
    BackendFactory inner = factoryOf(trace_, {[]{ return ok(kGood); }});
    BackendFactory f = [&built, inner](const QString& p){ ++built; return inner(p); };
    AcquisitionOrchestrator o(f, CardDataDecoder(), deviceLock_);

    std::promise<void> done;
    o.startAcquisition([&](const PatientRecord&){ o.rebind(); done.set_value(); },
                       [&](const AcquisitionFailure&){ done.set_value(); });
    done.get_future().get();
    o.wait();
    EXPECT_EQ(built, 2);
}

TEST_F(AcquisitionOrchestratorTest, VendorLibrary_BasicDataBlob_EndToEnd)
{
    writeCard("000012345678", u("王小明"), "A123456789");
    const int closesBefore = closeCount();

    AcquisitionOrchestrator o(vendorFactory(), CardDataDecoder("Big5", noDelay().basicData),
                              deviceLock_, FAKE_CSHIS_PATH);
    const AcquisitionResult r = o.acquire();
    ASSERT_TRUE(r.ok()) << r.failure().fullText().toStdString();
    EXPECT_EQ(r.record().source(), "basic-data");
    EXPECT_EQ(r.record().cardNumber(), "000012345678");
    EXPECT_EQ(r.record().fullName(), u("王小明"));
    // hisGetBasicData never opens the port, so there is nothing to close
    EXPECT_EQ(closeCount() - closesBefore, 0);
}

TEST_F(AcquisitionOrchestratorTest, VendorLibrary_BasicDataFails_FallsBackToSimpleRead)
{
    const QString text = u("A123456789|王小明|0750101|M|000012345678");
    nhilabel::test::writeFile(blobFile(), text.toUtf8());
    qputenv("FAKE_CSHIS_BASIC_RC", "4013");
    const int closesBefore = closeCount();

    AcquisitionOrchestrator o(vendorFactory(), CardDataDecoder("UTF-8"), deviceLock_, FAKE_CSHIS_PATH);
    const AcquisitionResult r = o.acquire();
    ASSERT_TRUE(r.ok()) << r.failure().fullText().toStdString();
    EXPECT_EQ(r.record().source(), "simple-read");
    EXPECT_EQ(r.record().idNumber(), "A123456789");
    EXPECT_EQ(r.record().fullName(), u("王小明"));
    EXPECT_EQ(closeCount() - closesBefore, 1);
}

TEST_F(AcquisitionOrchestratorTest, VendorLibrary_EveryCallFails_ContextNamesBothStrategies)
{
    qputenv("FAKE_CSHIS_RC", "4013");
    const int closesBefore = closeCount();

    AcquisitionOrchestrator o(vendorFactory(), CardDataDecoder(), deviceLock_, FAKE_CSHIS_PATH);
    const AcquisitionResult r = o.acquire();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.failure().category, ErrorCategory::DeviceCallFailed);
    EXPECT_TRUE(r.failure().context.contains("basic-data"));
    EXPECT_TRUE(r.failure().context.contains("simple-read"));
    // csOpenCom succeeded before csReadCard failed
    EXPECT_EQ(closeCount() - closesBefore, 1);
}

TEST(MakeBackendFactoryTest, StandaloneMode_NeverTouchesLibraries)
{
    ReaderOptions opt;
    opt.standalone = true;
    CandidateSources src;
    auto backend = makeBackendFactory(opt, src, AutomationFactory())(QString());
    EXPECT_EQ(backend->describe(), "offline (manual entry)");
}
