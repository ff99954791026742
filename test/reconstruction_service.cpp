#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE reconstruction service

#include "QtTestSupport.h"
#include "../src/kspace/FourierTransform.h"
#include "../src/kspace/ReconstructionService.h"
#include <boost/test/unit_test.hpp>
#include <vector>

BOOST_TEST_GLOBAL_FIXTURE( QtAppFixture );

namespace {

Spectrum makeSpectrum(int rows, int cols)
{
    SampleGrid grid(rows, cols);
    for(int y=0; y<rows; ++y)
        for(int x=0; x<cols; ++x)
            grid.at(x, y) = static_cast<float>((3*x + 7*y + x*y) % 200);
    return FourierTransform::forward(grid).value();
}

ReconstructedMessage fakeReply(quint64 sequence, uint8_t value)
{
    ReconstructedMessage msg;
    msg.sequence = sequence;
    msg.rows = 2;
    msg.cols = 2;
    msg.pixels.assign(4, value);
    return msg;
}

//records everything the service emits; disconnects itself when destroyed
struct ServiceProbe
{
    explicit ServiceProbe(ReconstructionService& service)
    {
        QObject::connect(&service, &ReconstructionService::resultReady, &context,
            [this](quint64 seq, const ReconstructionResult& r) { results.push_back(seq); last = r; });
        QObject::connect(&service, &ReconstructionService::failed, &context,
            [this](quint64 seq, KSpaceError kind, const QString& msg) {
                failures.push_back(seq); lastKind = kind; lastMessage = msg; });
        QObject::connect(&service, &ReconstructionService::spectrumLoaded, &context,
            [this](int, int) { ++loads; });
        QObject::connect(&service, &ReconstructionService::busyChanged, &context,
            [this](bool b) { busyEvents.push_back(b); });
    }

    QObject context;
    std::vector<quint64> results;
    std::vector<quint64> failures;
    std::vector<bool> busyEvents;
    ReconstructionResult last;
    KSpaceError lastKind = KSpaceError::None;
    QString lastMessage;
    int loads = 0;
};

}

BOOST_AUTO_TEST_SUITE( reconstruction_service )

    BOOST_AUTO_TEST_CASE( reconstruct_before_load )
    {
        ReconstructionService service;
        ServiceProbe probe(service);
        service.start();

        const quint64 seq = service.reconstruct(CircleMask{4, 4, 3});
        BOOST_CHECK_GT(seq, 0u);
        BOOST_REQUIRE(waitFor([&] { return !probe.failures.empty(); }));
        BOOST_CHECK_EQUAL(probe.failures.back(), seq);
        BOOST_CHECK(probe.lastKind == KSpaceError::NoSpectrumLoaded);
        BOOST_CHECK(probe.lastMessage == "Spectrum not loaded");
        BOOST_CHECK(probe.results.empty());
        BOOST_CHECK(!service.isBusy());
    }

    BOOST_AUTO_TEST_CASE( load_then_reconstruct )
    {
        const Spectrum spectrum = makeSpectrum(24, 32);
        const CircleMask mask{16, 12, 5};

        ReconstructionService service;
        ServiceProbe probe(service);
        service.start();
        BOOST_REQUIRE(service.load(spectrum));
        BOOST_REQUIRE(waitFor([&] { return probe.loads == 1; }));

        const quint64 seq = service.reconstruct(mask);
        BOOST_REQUIRE(waitFor([&] { return !probe.results.empty(); }));
        BOOST_CHECK_EQUAL(probe.results.back(), seq);

        const ReconstructionResult expected = ReconstructionWorker::reconstruct(spectrum, mask).value();
        BOOST_CHECK_EQUAL(probe.last.rows, 24);
        BOOST_CHECK_EQUAL(probe.last.cols, 32);
        BOOST_CHECK_EQUAL_COLLECTIONS(probe.last.pixels.begin(), probe.last.pixels.end(),
                                      expected.pixels.begin(), expected.pixels.end());
    }

    BOOST_AUTO_TEST_CASE( same_mask_is_idempotent )
    {
        ReconstructionService service;
        ServiceProbe probe(service);
        service.start();
        BOOST_REQUIRE(service.load(makeSpectrum(17, 17)));

        service.reconstruct(CircleMask{8, 8, 4});
        BOOST_REQUIRE(waitFor([&] { return probe.results.size() == 1; }));
        const ReconstructionResult first = probe.last;

        service.reconstruct(CircleMask{8, 8, 4});
        BOOST_REQUIRE(waitFor([&] { return probe.results.size() == 2; }));
        BOOST_CHECK_EQUAL_COLLECTIONS(first.pixels.begin(), first.pixels.end(),
                                      probe.last.pixels.begin(), probe.last.pixels.end());
    }

    BOOST_AUTO_TEST_CASE( zero_radius_is_raised_to_one )
    {
        const Spectrum spectrum = makeSpectrum(16, 16);
        ReconstructionService service;
        ServiceProbe probe(service);
        service.start();
        BOOST_REQUIRE(service.load(spectrum));

        service.reconstruct(CircleMask{8, 8, 0});
        BOOST_REQUIRE(waitFor([&] { return !probe.results.empty(); }));
        const ReconstructionResult expected = ReconstructionWorker::reconstruct(spectrum, CircleMask{8, 8, 1}).value();
        BOOST_CHECK_EQUAL_COLLECTIONS(probe.last.pixels.begin(), probe.last.pixels.end(),
                                      expected.pixels.begin(), expected.pixels.end());
    }

    BOOST_AUTO_TEST_CASE( stale_result_is_dropped )
    {
        ReconstructionService service;
        ServiceProbe probe(service);
        service.start();
        BOOST_REQUIRE(service.load(makeSpectrum(8, 8)));

        const quint64 first = service.reconstruct(CircleMask{4, 4, 2});
        const quint64 second = service.reconstruct(CircleMask{4, 4, 3});
        BOOST_REQUIRE_LT(first, second);
        BOOST_CHECK(service.isBusy());

        //replies arrive out of order, before the event loop delivers the real ones
        service.handleReconstructed(fakeReply(second, 200));
        service.handleReconstructed(fakeReply(first, 10));

        BOOST_REQUIRE_EQUAL(probe.results.size(), 1u);
        BOOST_CHECK_EQUAL(probe.results.back(), second);
        BOOST_CHECK_EQUAL(probe.last.pixels[0], 200);
        BOOST_CHECK_EQUAL(service.lastAppliedSequence(), second);
        BOOST_CHECK(!service.isBusy());

        //the worker's genuine replies for both are now stale as well
        pumpEvents(300);
        BOOST_CHECK_EQUAL(probe.results.size(), 1u);
        BOOST_CHECK_EQUAL(probe.last.pixels[0], 200);
    }

    BOOST_AUTO_TEST_CASE( stale_error_is_dropped )
    {
        ReconstructionService service;
        ServiceProbe probe(service);
        service.start();
        BOOST_REQUIRE(service.load(makeSpectrum(8, 8)));

        const quint64 first = service.reconstruct(CircleMask{4, 4, 2});
        const quint64 second = service.reconstruct(CircleMask{4, 4, 3});
        service.handleReconstructed(fakeReply(second, 50));

        ErrorMessage err;
        err.sequence = first;
        err.kind = KSpaceError::NoSpectrumLoaded;
        err.message = "late";
        service.handleError(err);
        BOOST_CHECK(probe.failures.empty());
    }

    BOOST_AUTO_TEST_CASE( load_invalidates_pending_requests )
    {
        ReconstructionService service;
        ServiceProbe probe(service);
        service.start();
        BOOST_REQUIRE(service.load(makeSpectrum(8, 8)));

        const quint64 before = service.reconstruct(CircleMask{4, 4, 2});
        BOOST_REQUIRE(service.load(makeSpectrum(12, 10)));
        BOOST_CHECK(!service.isBusy());

        service.handleReconstructed(fakeReply(before, 99));
        BOOST_CHECK(probe.results.empty());

        const quint64 after = service.reconstruct(CircleMask{5, 6, 3});
        BOOST_REQUIRE(waitFor([&] { return !probe.results.empty(); }));
        BOOST_CHECK_EQUAL(probe.results.back(), after);
        BOOST_CHECK_EQUAL(probe.last.rows, 12);
        BOOST_CHECK_EQUAL(probe.last.cols, 10);
    }

    BOOST_AUTO_TEST_CASE( busy_tracks_outstanding_requests )
    {
        ReconstructionService service;
        ServiceProbe probe(service);
        service.start();
        BOOST_REQUIRE(service.load(makeSpectrum(16, 16)));

        service.reconstruct(CircleMask{8, 8, 3});
        service.reconstruct(CircleMask{8, 8, 4});
        BOOST_REQUIRE_EQUAL(probe.busyEvents.size(), 1u);
        BOOST_CHECK(probe.busyEvents.front());

        BOOST_REQUIRE(waitFor([&] { return !service.isBusy(); }));
        BOOST_REQUIRE_EQUAL(probe.busyEvents.size(), 2u);
        BOOST_CHECK(!probe.busyEvents.back());
    }

    BOOST_AUTO_TEST_CASE( channel_failure )
    {
        ReconstructionService service;
        ServiceProbe probe(service);

        //never started
        BOOST_CHECK_EQUAL(service.reconstruct(CircleMask{1, 1, 1}), 0u);
        BOOST_REQUIRE_EQUAL(probe.failures.size(), 1u);
        BOOST_CHECK(probe.lastKind == KSpaceError::ChannelFailure);

        service.start();
        BOOST_CHECK(service.isRunning());
        BOOST_REQUIRE(service.load(makeSpectrum(8, 8)));
        service.shutdown();
        BOOST_CHECK(!service.isRunning());

        BOOST_CHECK(!service.load(makeSpectrum(8, 8)));
        BOOST_CHECK_EQUAL(service.reconstruct(CircleMask{4, 4, 2}), 0u);
        BOOST_CHECK_EQUAL(probe.failures.size(), 3u);
        BOOST_CHECK(probe.lastKind == KSpaceError::ChannelFailure);
    }

    BOOST_AUTO_TEST_CASE( worker_rejects_without_spectrum )
    {
        Result<ReconstructionResult> r = ReconstructionWorker::reconstruct(Spectrum(), CircleMask{0, 0, 1});
        BOOST_CHECK(r.errorKind() == KSpaceError::NoSpectrumLoaded);
        BOOST_CHECK(r.error() == "Spectrum not loaded");
    }

BOOST_AUTO_TEST_SUITE_END() //reconstruction_service
