#include <catch2/catch_test_macros.hpp>

#include "settings.hpp"
#include "stt/client.hpp"
#include "stt/http_transport.hpp"
#include "stt/transcription_job.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Echoes the model name back as the transcript. While `block` is set it
// waits until the request is cancelled, like a server that never answers.
class SlowTransport : public HttpTransport {
public:
    std::expected<HttpResponse, SttError>
    send(const TranscriptionRequest& request, std::stop_token stop) override {
        ++in_flight;
        while (block.load() && !stop.stop_requested()) {
            std::this_thread::sleep_for(1ms);
        }
        --in_flight;
        if (stop.stop_requested()) {
            return std::unexpected(SttError::cancelled());
        }
        auto model = request.find_part("model")->data;
        return HttpResponse{.status = 200, .body = R"({"text": ")" + model + R"("})"};
    }

    std::atomic<bool> block{false};
    std::atomic<int> in_flight{0};
};

Settings settings_with_model(const std::string& model) {
    Settings s;
    s.stt_api.enabled = true;
    s.stt_api.models["openai"] = model;
    return s;
}

} // namespace

TEST_CASE("TranscriptionJob", "[stt][job]") {
    SlowTransport transport;
    SttClient client(transport);
    std::vector<float> samples(160, 0.0f);

    SECTION("CompletesAndInvokesCallback") {
        TranscriptionJob job(client);
        std::promise<std::string> seen;
        auto seen_future = seen.get_future();

        REQUIRE(job.start(settings_with_model("alpha"), samples,
                          [&](const TranscriptionJob::Result& r) {
                              seen.set_value(r.value_or(""));
                          }));
        job.wait();

        REQUIRE_FALSE(job.running());
        REQUIRE(job.result()->value() == "alpha");
        REQUIRE(seen_future.wait_for(5s) == std::future_status::ready);
        REQUIRE(seen_future.get() == "alpha");
    }

    SECTION("CallbackMayWaitOnItsOwnJob") {
        TranscriptionJob job(client);
        std::promise<std::string> seen;
        auto seen_future = seen.get_future();

        REQUIRE(job.start(settings_with_model("gamma"), samples,
                          [&](const TranscriptionJob::Result&) {
                              job.wait();
                              seen.set_value(job.result()->value());
                          }));

        REQUIRE(seen_future.wait_for(5s) == std::future_status::ready);
        REQUIRE(seen_future.get() == "gamma");
    }

    SECTION("ThrowingCallbackKeepsResult") {
        TranscriptionJob job(client);
        std::promise<void> called;
        auto called_future = called.get_future();

        REQUIRE(job.start(settings_with_model("delta"), samples,
                          [&](const TranscriptionJob::Result&) {
                              called.set_value();
                              throw std::runtime_error("consumer failed");
                          }));
        job.wait();
        REQUIRE(called_future.wait_for(5s) == std::future_status::ready);
        REQUIRE(job.result()->value() == "delta");

        // The worker survived the throw, so the job can run again.
        REQUIRE(job.start(settings_with_model("epsilon"), samples));
        job.wait();
        REQUIRE(job.result()->value() == "epsilon");
    }

    SECTION("RestartFromCallbackIsRejected") {
        TranscriptionJob job(client);
        std::promise<bool> restarted;
        auto restarted_future = restarted.get_future();

        REQUIRE(job.start(settings_with_model("zeta"), samples,
                          [&](const TranscriptionJob::Result&) {
                              restarted.set_value(job.start(settings_with_model("eta"), samples));
                          }));

        REQUIRE(restarted_future.wait_for(5s) == std::future_status::ready);
        REQUIRE_FALSE(restarted_future.get());
        REQUIRE_FALSE(job.running());
        REQUIRE(job.result()->value() == "zeta");
    }

    SECTION("ErrorsAreReported") {
        TranscriptionJob job(client);
        REQUIRE(job.start(Settings{}, samples));
        job.wait();
        REQUIRE(job.result()->error().kind == SttErrorKind::NotEnabled);
    }

    SECTION("CancelDropsResultWithoutCallback") {
        transport.block = true;
        TranscriptionJob job(client);
        std::atomic<int> callbacks{0};

        REQUIRE(job.start(settings_with_model("beta"), samples,
                          [&](const TranscriptionJob::Result&) { ++callbacks; }));
        REQUIRE_FALSE(job.wait_for(20ms));
        REQUIRE(job.running());

        job.cancel();
        REQUIRE(job.wait_for(5s));
        REQUIRE(job.result()->error().kind == SttErrorKind::Cancelled);
        REQUIRE(callbacks == 0);
        REQUIRE(transport.in_flight == 0);
    }

    SECTION("SecondStartWhileRunningIsRejected") {
        transport.block = true;
        TranscriptionJob job(client);
        REQUIRE(job.start(settings_with_model("one"), samples));
        REQUIRE_FALSE(job.start(settings_with_model("two"), samples));
        job.cancel();
        job.wait();
    }

    SECTION("JobCanBeReused") {
        TranscriptionJob job(client);
        REQUIRE(job.start(settings_with_model("first"), samples));
        job.wait();
        REQUIRE(job.start(settings_with_model("second"), samples));
        job.wait();
        REQUIRE(job.result()->value() == "second");
    }

    SECTION("ConcurrentJobsAreIndependent") {
        TranscriptionJob a(client);
        TranscriptionJob b(client);
        REQUIRE(a.start(settings_with_model("left"), samples));
        REQUIRE(b.start(settings_with_model("right"), samples));
        a.wait();
        b.wait();
        REQUIRE(a.result()->value() == "left");
        REQUIRE(b.result()->value() == "right");
    }

    SECTION("SnapshotIsCapturedAtStart") {
        transport.block = true;
        auto settings = settings_with_model("captured");
        TranscriptionJob job(client);
        REQUIRE(job.start(settings, samples));

        settings.stt_api.models["openai"] = "changed";
        transport.block = false;
        job.wait();
        REQUIRE(job.result()->value() == "captured");
    }

    SECTION("DestructorCancelsInFlightRequest") {
        transport.block = true;
        {
            TranscriptionJob job(client);
            REQUIRE(job.start(settings_with_model("gone"), samples));
        }
        REQUIRE(transport.in_flight == 0);
    }
}
