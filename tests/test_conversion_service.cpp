#include <doctest/doctest.h>
#include "service/ConversionService.h"
#include "TestFixtures.h"
#include <future>
#include <thread>

using namespace LabPBR;
using TestFixtures::textBytes;

namespace {

class FailingDepthEstimator : public DepthEstimator {
public:
    Result<PixelBuffer> estimate(const PixelBuffer&) override {
        return Result<PixelBuffer>::failure(ErrorKind::DepthUnavailable, "Depth request failed (500): down");
    }
    std::string name() const override { return "failing"; }
};

// Holds the only worker inside a conversion until released
class BlockingDepthEstimator : public DepthEstimator {
public:
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    Result<PixelBuffer> estimate(const PixelBuffer& image) override {
        started.set_value();
        released.wait();
        return Result<PixelBuffer>::success(PixelBuffer::filled(image.width(), image.height(), 1, 128));
    }
    std::string name() const override { return "blocking"; }
};

std::unique_ptr<ConversionService> makeService(std::shared_ptr<DepthEstimator> estimator = nullptr) {
    ServiceConfig config;
    config.workerCount = 1;
    return ConversionService::create(config, std::move(estimator));
}

} // namespace

TEST_SUITE("ConversionService") {
    TEST_CASE("submit rejects bad uploads without creating a job") {
        auto service = makeService();
        REQUIRE(service);

        Result<std::string> noName = service->submit("", {1, 2, 3});
        REQUIRE_FALSE(noName);
        CHECK(noName.error().kind == ErrorKind::UploadError);
        CHECK(noName.error().message == "No file uploaded");

        Result<std::string> empty = service->submit("stone.png", {});
        REQUIRE_FALSE(empty);
        CHECK(empty.error().message == "Empty file uploaded");

        Result<std::string> badSettings = service->submit("stone.png", {1, 2, 3}, R"({"normalStrength": 9})");
        REQUIRE_FALSE(badSettings);
        CHECK(badSettings.error().kind == ErrorKind::SettingsError);

        CHECK(service->jobs().empty());
    }

    TEST_CASE("conversion end to end") {
        auto service = makeService();
        REQUIRE(service);

        Result<std::string> submitted = service->submit("textures/stone.png",
                                                        TestFixtures::solidPng(4, 4, 120, 90, 60, 255),
                                                        R"({"generateAO": false})");
        REQUIRE(submitted);
        service->waitForIdle();

        const std::string& id = submitted.value();
        std::optional<ConversionJob> job = service->job(id);
        REQUIRE(job.has_value());
        CHECK(job->status == JobStatus::Completed);
        CHECK_FALSE(job->settings.generateAO);
        CHECK(service->status(id)->progress == 100);
        CHECK(service->files(id).size() == 1);
        CHECK(service->jobs().size() == 1);

        DownloadResult download = service->download(id);
        REQUIRE(download.status == DownloadStatus::Ok);
        CHECK(download.filename == "stone_labpbr.zip");

        Result<std::vector<ArchiveEntry>> entries = ResourcePackCodec::extractEntries(download.bytes);
        REQUIRE(entries);
        CHECK(TestFixtures::findEntry(entries.value(), "pack.mcmeta") != nullptr);
        CHECK(TestFixtures::findEntry(entries.value(), "textures/stone_n.png") != nullptr);

        // Finished jobs cannot be cancelled and are no longer tracked
        CHECK_FALSE(service->cancel(id));
        CHECK(service->trackedJobCount() == 0);
    }

    TEST_CASE("download of unknown or failed jobs") {
        auto service = makeService(std::make_shared<FailingDepthEstimator>());
        REQUIRE(service);

        DownloadResult missing = service->download("999");
        CHECK(missing.status == DownloadStatus::NotFound);
        CHECK(missing.message == "Conversion job not found");

        Result<std::string> submitted = service->submit("stone.png", TestFixtures::solidPng(4, 4, 1, 2, 3, 255));
        REQUIRE(submitted);
        service->waitForIdle();

        CHECK(service->job(submitted.value())->status == JobStatus::Failed);
        DownloadResult failed = service->download(submitted.value());
        CHECK(failed.status == DownloadStatus::NotCompleted);
        CHECK(failed.message == "Conversion not completed");
        CHECK(failed.bytes.empty());
    }

    TEST_CASE("cancel of an unknown job") {
        auto service = makeService();
        REQUIRE(service);
        CHECK_FALSE(service->cancel("nope"));
    }

    TEST_CASE("validate a single specular map") {
        auto service = makeService();
        REQUIRE(service);

        std::future<ValidationReport> future = service->validate("stone_s.png",
                                                                 TestFixtures::solidPng(4, 4, 200, 10, 0, 255));
        ValidationReport report = future.get();
        CHECK_FALSE(report.isValid);
        CHECK(report.specVersion == LABPBR_SPEC_VERSION);
        CHECK(report.totalFiles == 1);
        CHECK(report.textureFiles == 1);
        REQUIRE(report.fileDetails.size() == 1);
        CHECK(report.fileDetails[0].filename == "stone_s.png");
        CHECK(report.count(IssueLevel::Error) == 1);
        CHECK(report.issues[0].filename == "stone_s.png");
    }

    TEST_CASE("validate a resource pack") {
        auto service = makeService();
        REQUIRE(service);

        std::vector<uint8_t> zip = TestFixtures::makeZip({
            {"pack.mcmeta", textBytes(R"({"pack":{"pack_format":15}})")},
            {"textures/a_s.png", TestFixtures::solidPng(4, 4, 200, 10, 0, 0)},
            {"textures/a_n.png", TestFixtures::solidPng(4, 4, 128, 128, 255, 255)},
        });
        REQUIRE_FALSE(zip.empty());

        ValidationReport report = service->validate("pack.zip", zip).get();
        CHECK(report.isValid);
        CHECK(report.totalFiles == 3);
        CHECK(report.textureFiles == 2);
        CHECK(report.count(IssueLevel::Error) == 0);

        ValidationReport broken = service->validate("broken.zip", textBytes("not a zip")).get();
        CHECK_FALSE(broken.isValid);
        CHECK(broken.textureFiles == 0);
        REQUIRE(broken.issues.size() == 1);
        CHECK(broken.issues[0].issue.message.rfind("Failed to read archive: ", 0) == 0);
    }

    TEST_CASE("analyze runs on the pool") {
        auto service = makeService();
        REQUIRE(service);

        Result<MaterialReport> report = service->analyze(TestFixtures::solidPng(4, 4, 128, 10, 0, 0), "x_s.png").get();
        REQUIRE(report);
        CHECK(report.value().width == 4);
        REQUIRE(report.value().closestMaterial.has_value());
        CHECK(report.value().closestMaterial->f0 == 10);

        Result<MaterialReport> broken = service->analyze(textBytes("garbage")).get();
        REQUIRE_FALSE(broken);
        CHECK(broken.error().kind == ErrorKind::DecodeError);
    }

    TEST_CASE("after shutdown nothing is left pending") {
        auto service = makeService();
        REQUIRE(service);
        service->shutdown();

        Result<std::string> submitted = service->submit("stone.png", TestFixtures::solidPng(4, 4, 1, 2, 3, 255));
        REQUIRE_FALSE(submitted);
        REQUIRE(service->jobs().size() == 1);
        CHECK(service->jobs()[0].status == JobStatus::Failed);

        ValidationReport report = service->validate("a_s.png", TestFixtures::solidPng(4, 4, 1, 2, 3, 0)).get();
        CHECK_FALSE(report.isValid);

        Result<MaterialReport> analysis = service->analyze(TestFixtures::solidPng(4, 4, 1, 2, 3, 0)).get();
        CHECK_FALSE(analysis);
    }

    TEST_CASE("shutdown settles work still waiting in the queue") {
        auto estimator = std::make_shared<BlockingDepthEstimator>();
        auto service = makeService(estimator);
        REQUIRE(service);

        Result<std::string> running = service->submit("first.png", TestFixtures::solidPng(4, 4, 1, 2, 3, 255));
        REQUIRE(running);
        estimator->started.get_future().wait();

        Result<std::string> queued = service->submit("second.png", TestFixtures::solidPng(4, 4, 1, 2, 3, 255));
        REQUIRE(queued);
        std::future<ValidationReport> validation =
            service->validate("a_s.png", TestFixtures::solidPng(4, 4, 200, 10, 0, 0));
        std::future<Result<MaterialReport>> analysis =
            service->analyze(TestFixtures::solidPng(4, 4, 200, 10, 0, 0));
        CHECK(service->trackedJobCount() == 2);

        std::thread releaser([&estimator]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            estimator->release.set_value();
        });
        service->shutdown();
        releaser.join();

        // The running job finishes, the queued one fails instead of staying pending
        CHECK(service->job(running.value())->status == JobStatus::Completed);
        ConversionJob dropped = *service->job(queued.value());
        CHECK(dropped.status == JobStatus::Failed);
        REQUIRE(dropped.errors.size() == 1);
        CHECK(dropped.errors[0] == "Conversion service is shutting down");
        CHECK(service->trackedJobCount() == 0);

        REQUIRE(validation.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
        ValidationReport report = validation.get();
        CHECK_FALSE(report.isValid);
        REQUIRE(report.issues.size() == 1);
        CHECK(report.issues[0].issue.message == "Validation service is shutting down");

        REQUIRE(analysis.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
        Result<MaterialReport> analyzed = analysis.get();
        REQUIRE_FALSE(analyzed);
        CHECK(analyzed.error().kind == ErrorKind::ProcessingError);
    }
}
