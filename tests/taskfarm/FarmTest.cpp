#include <gtest/gtest.h>
#include "taskfarm/farm.h"
#include "taskfarm/errors.h"
#include "support/TempDirectory.h"

#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

using taskfarm::ExecutionContext;
using taskfarm::Farm;
using taskfarm::FarmOptions;
using taskfarm::LaunchRequest;
using taskfarm::Settings;
using taskfarm::TaskSource;

// Records every request and answers with the queued statuses, 0 once they run out.
class RecordingLauncher : public taskfarm::Launcher {
public:
    explicit RecordingLauncher(std::vector<int32_t> statuses = {}) : _statuses(std::move(statuses)) {}

    int32_t launch(const LaunchRequest& request) override {
        requests.push_back(request);
        configs.push_back(readText(request.configPath));

        if (_statuses.empty()) {
            return 0;
        }

        int32_t status = _statuses.front();
        _statuses.erase(_statuses.begin());

        return status;
    }

    std::vector<LaunchRequest> requests;
    std::vector<std::string> configs;

private:
    std::vector<int32_t> _statuses;
};

class FarmTest : public ::testing::Test {
protected:
    ExecutionContext makeContext(uint32_t slotCount) const {
        ExecutionContext context;
        context.allocationId = "4242";
        context.taskCount = slotCount;
        context.scratchDir = tempDir.path().string();

        return context;
    }

    std::string workDir() const {
        return (tempDir.path() / "taskfarm.4242").string();
    }

    std::vector<std::string> makeArguments(int count) const {
        std::vector<std::string> arguments;
        for (int argumentIndex = 0; argumentIndex != count; ++argumentIndex) {
            arguments.push_back("p" + std::to_string(argumentIndex));
        }

        return arguments;
    }

    TempDirectory tempDir;
    Settings settings;
};

TEST_F(FarmTest, CommandFileRunsOneLaunchWithPerSlotScripts) {
    auto commandFile = tempDir.file("tasks.txt",
        "./sim 0 > o0\n./sim 1 > o1\n./sim 2 > o2\n# ./sim skipped\n./sim 3 > o3\n./sim 4 > o4\n./sim 5 > o5\n");
    Farm farm(makeContext(3), settings, FarmOptions{});
    RecordingLauncher launcher;

    int32_t status = farm.run(TaskSource::commandFile(commandFile), launcher);

    EXPECT_EQ(status, 0);
    ASSERT_EQ(launcher.requests.size(), 1u);
    EXPECT_EQ(launcher.requests[0].configPath, workDir() + "/multiprog.conf");
    EXPECT_EQ(launcher.requests[0].launcherCommand, (std::vector<std::string>{ "srun", "--multi-prog" }));

    std::string slotCommand = "/bin/bash " + workDir() + "/slot_%t.sh";
    EXPECT_EQ(launcher.configs[0], "0 " + slotCommand + "\n1 " + slotCommand + "\n2 " + slotCommand + "\n");

    EXPECT_EQ(readText(workDir() + "/slot_0.sh"), "#!/bin/bash\n./sim 0 > o0\n./sim 3 > o3\n");
    EXPECT_EQ(readText(workDir() + "/slot_1.sh"), "#!/bin/bash\n./sim 1 > o1\n./sim 4 > o4\n");
    EXPECT_EQ(readText(workDir() + "/slot_2.sh"), "#!/bin/bash\n./sim 2 > o2\n./sim 5 > o5\n");
}

TEST_F(FarmTest, ShortCommandFilePadsScriptsWithNoop) {
    auto commandFile = tempDir.file("tasks.txt", "echo a > a\n");
    Farm farm(makeContext(3), settings, FarmOptions{});

    auto plan = farm.plan(TaskSource::commandFile(commandFile));

    ASSERT_EQ(plan.rounds.size(), 1u);
    EXPECT_EQ(plan.rounds[0].assignment.noopCount(), 2u);
    EXPECT_EQ(readText(workDir() + "/slot_2.sh"), "#!/bin/bash\ntrue\n");
}

TEST_F(FarmTest, FewArgumentsMakeOnePaddedRound) {
    Farm farm(makeContext(5), settings, FarmOptions{ .bareParameters = true });
    RecordingLauncher launcher;

    int32_t status = farm.run(TaskSource::commandTemplate("./analyse", makeArguments(2)), launcher);

    EXPECT_EQ(status, 0);
    ASSERT_EQ(launcher.configs.size(), 1u);
    EXPECT_EQ(launcher.configs[0], "0 ./analyse p0\n1 ./analyse p1\n2 true\n3 true\n4 true\n");
}

TEST_F(FarmTest, ManyArgumentsRunRoundAfterRound) {
    Farm farm(makeContext(3), settings, FarmOptions{ .bareParameters = true });
    RecordingLauncher launcher;

    int32_t status = farm.run(TaskSource::commandTemplate("./analyse", makeArguments(7)), launcher);

    EXPECT_EQ(status, 0);
    ASSERT_EQ(launcher.requests.size(), 3u);
    EXPECT_EQ(launcher.requests[0].configPath, workDir() + "/round_0.conf");
    EXPECT_EQ(launcher.requests[2].configPath, workDir() + "/round_2.conf");
    EXPECT_EQ(launcher.configs[0], "0 ./analyse p0\n1 ./analyse p1\n2 ./analyse p2\n");
    EXPECT_EQ(launcher.configs[1], "0 ./analyse p3\n1 ./analyse p4\n2 ./analyse p5\n");
    EXPECT_EQ(launcher.configs[2], "0 ./analyse p6\n1 true\n2 true\n");
}

TEST_F(FarmTest, FailingRoundStopsTheRun) {
    Farm farm(makeContext(2), settings, FarmOptions{ .bareParameters = true });
    RecordingLauncher launcher({ 0, 7 });

    int32_t status = farm.run(TaskSource::commandTemplate("./analyse", makeArguments(6)), launcher);

    EXPECT_EQ(status, 7);
    EXPECT_EQ(launcher.requests.size(), 2u);
}

TEST_F(FarmTest, DelayStaggersEverySlot) {
    Farm farm(makeContext(4), settings, FarmOptions{ .delay = true, .bareParameters = true });
    RecordingLauncher launcher;

    farm.run(TaskSource::commandTemplate("./solver", makeArguments(4)), launcher);

    ASSERT_EQ(launcher.configs.size(), 1u);
    EXPECT_EQ(launcher.configs[0],
        "0 sleep 0.0 && ./solver p0\n"
        "1 sleep 0.1 && ./solver p1\n"
        "2 sleep 0.2 && ./solver p2\n"
        "3 sleep 0.3 && ./solver p3\n");
}

TEST_F(FarmTest, CommandFileDelaySleepsInsideSlotScripts) {
    auto commandFile = tempDir.file("tasks.txt", "./sim 0 > o0\n./sim 1 > o1\n./sim 2 > o2\n");
    Farm farm(makeContext(3), settings, FarmOptions{ .delay = true });
    RecordingLauncher launcher;

    farm.run(TaskSource::commandFile(commandFile), launcher);

    // The launcher line is run without a shell and stays a plain script invocation.
    std::string slotCommand = "/bin/bash " + workDir() + "/slot_%t.sh";
    ASSERT_EQ(launcher.configs.size(), 1u);
    EXPECT_EQ(launcher.configs[0], "0 " + slotCommand + "\n1 " + slotCommand + "\n2 " + slotCommand + "\n");

    EXPECT_EQ(readText(workDir() + "/slot_0.sh"), "#!/bin/bash\nsleep 0.0\n./sim 0 > o0\n");
    EXPECT_EQ(readText(workDir() + "/slot_1.sh"), "#!/bin/bash\nsleep 0.1\n./sim 1 > o1\n");
    EXPECT_EQ(readText(workDir() + "/slot_2.sh"), "#!/bin/bash\nsleep 0.2\n./sim 2 > o2\n");
}

TEST_F(FarmTest, WarnsWhenNoTaskRedirectsItsOutput) {
    Farm farm(makeContext(2), settings, FarmOptions{ .bareParameters = true });

    testing::internal::CaptureStderr();
    farm.plan(TaskSource::commandTemplate("./analyse", makeArguments(2)));
    std::string log = testing::internal::GetCapturedStderr();

    EXPECT_NE(log.find("No task redirects its output"), std::string::npos) << log;
}

TEST_F(FarmTest, RedirectedOutputNeedsNoWarning) {
    Farm farm(makeContext(2), settings, FarmOptions{ .bareParameters = true });

    testing::internal::CaptureStderr();
    farm.plan(TaskSource::commandTemplate("./analyse {} > {}.out", makeArguments(2)));
    std::string log = testing::internal::GetCapturedStderr();

    EXPECT_EQ(log.find("No task redirects its output"), std::string::npos) << log;
}

TEST_F(FarmTest, TemplateWithoutArgumentsRunsOnEverySlot) {
    Farm farm(makeContext(3), settings, FarmOptions{});
    RecordingLauncher launcher;

    farm.run(TaskSource::commandTemplate("./worker --rank %t", {}), launcher);

    ASSERT_EQ(launcher.configs.size(), 1u);
    EXPECT_EQ(launcher.configs[0], "0 ./worker --rank %t\n1 ./worker --rank %t\n2 ./worker --rank %t\n");
}

TEST_F(FarmTest, MissingFileArgumentBecomesNoop) {
    auto existing = tempDir.file("a.dat", "");
    auto missing = (tempDir.path() / "b.dat").string();
    Farm farm(makeContext(2), settings, FarmOptions{});
    RecordingLauncher launcher;

    farm.run(TaskSource::commandTemplate("wc -l", { existing, missing }), launcher);

    ASSERT_EQ(launcher.configs.size(), 1u);
    EXPECT_EQ(launcher.configs[0], "0 wc -l " + existing + "\n1 true\n");
}

TEST_F(FarmTest, DryRunPrintsWithoutLaunching) {
    Farm farm(makeContext(2), settings, FarmOptions{ .bareParameters = true, .dryRun = true });
    RecordingLauncher launcher;
    std::ostringstream output;

    int32_t status = farm.run(TaskSource::commandTemplate("./analyse", makeArguments(3)), launcher, output);

    EXPECT_EQ(status, 0);
    EXPECT_TRUE(launcher.requests.empty());
    EXPECT_EQ(output.str(),
        "# " + workDir() + "/round_0.conf\n0 ./analyse p0\n1 ./analyse p1\n"
        "# " + workDir() + "/round_1.conf\n0 ./analyse p2\n1 true\n");
}

TEST_F(FarmTest, StaleFilesAreClearedAndManifestWritten) {
    fs::create_directories(workDir());
    std::ofstream(workDir() + "/round_5.conf") << "0 stale\n";
    Farm farm(makeContext(2), settings, FarmOptions{ .bareParameters = true });

    farm.plan(TaskSource::commandTemplate("./analyse", makeArguments(3)));

    EXPECT_FALSE(fs::exists(workDir() + "/round_5.conf"));

    auto manifest = nlohmann::json::parse(readText(workDir() + "/manifest.json"));
    EXPECT_EQ(manifest.at("mode"), "template");
    EXPECT_EQ(manifest.at("slots"), 2);
    EXPECT_EQ(manifest.at("tasks"), 3);
    ASSERT_EQ(manifest.at("rounds").size(), 2u);
    EXPECT_EQ(manifest.at("rounds")[1].at("noop_slots"), 1);
    EXPECT_EQ(manifest.at("rounds")[0].at("config"), workDir() + "/round_0.conf");
}

TEST_F(FarmTest, ThreadHintIsForwardedToLauncher) {
    Farm farm(makeContext(2), settings, FarmOptions{ .threadsPerTask = 8, .bareParameters = true });
    RecordingLauncher launcher;

    farm.run(TaskSource::commandTemplate("./omp_app", makeArguments(2)), launcher);

    ASSERT_EQ(launcher.requests.size(), 1u);
    EXPECT_EQ(launcher.requests[0].threadsPerTask, 8u);
}

TEST_F(FarmTest, NoAllocationFailsBeforeWritingAnything) {
    ExecutionContext context;
    context.scratchDir = tempDir.path().string();
    Farm farm(context, settings, FarmOptions{ .bareParameters = true });
    RecordingLauncher launcher;

    EXPECT_THROW(farm.run(TaskSource::commandTemplate("./analyse", makeArguments(2)), launcher), taskfarm::PreconditionError);
    EXPECT_TRUE(launcher.requests.empty());
    EXPECT_FALSE(fs::exists(workDir()));
}

TEST_F(FarmTest, ZeroThreadsIsRejected) {
    EXPECT_THROW(Farm farm(makeContext(2), settings, FarmOptions{ .threadsPerTask = 0 }), std::invalid_argument);
}
