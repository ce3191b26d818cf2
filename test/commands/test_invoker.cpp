#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include "test_utils.hpp"
#include "cli/CommandArgs.hpp"
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/LogCommand.hpp"
#include "cli/commands/StatusCommand.hpp"

namespace fs = std::filesystem;

using namespace gitquery;
using namespace gitquery::test::utils;

class CommandInvokerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& f = CommandFactory::instance();
        f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
        f.registerCreator("status", [] { return std::make_unique<StatusCommand>(); });
        f.registerCreator("log", [] { return std::make_unique<LogCommand>(); });

        ctx.input = &input;

        // Capture output
        oldCout = std::cout.rdbuf();
        oldCerr = std::cerr.rdbuf();
        outputStream = std::stringstream();
        errorStream = std::stringstream();
        std::cout.rdbuf(outputStream.rdbuf());
        std::cerr.rdbuf(errorStream.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(oldCout);
        std::cerr.rdbuf(oldCerr);
    }

    std::string getOutput() {
        return outputStream.str();
    }

    AppContext ctx;
    std::istringstream input;
    std::stringstream outputStream;
    std::stringstream errorStream;
    std::streambuf* oldCout;
    std::streambuf* oldCerr;
};

// Test: Registered commands are created fresh and listed by name
TEST_F(CommandInvokerTest, FactoryRegistry) {
    auto& f = CommandFactory::instance();
    EXPECT_TRUE(f.has("status"));
    EXPECT_FALSE(f.has("commit"));
    EXPECT_EQ(f.create("commit"), nullptr);

    auto commands = f.listCommands();
    ASSERT_GE(commands.size(), 3u);
    for (size_t i = 1; i < commands.size(); ++i) {
        EXPECT_LT(std::string(commands[i - 1]->name()), std::string(commands[i]->name()));
    }
}

// Test: Dispatch runs the named command with the remaining arguments
TEST_F(CommandInvokerTest, RunDispatches) {
    input.str("?? new.txt\n");
    CommandInvoker invoker;
    EXPECT_EQ(invoker.run(ctx, {"status", "--untracked"}), 0);
    EXPECT_EQ(getOutput(), "?? new.txt\n");
}

// Test: Command errors map to exit code 1 and are logged
TEST_F(CommandInvokerTest, RunReportsErrors) {
    CommandInvoker invoker;
    EXPECT_EQ(invoker.run(ctx, {"log", "--merges", "--no-merges"}), 1);
    EXPECT_NE(errorStream.str().find("log: --merges and --no-merges are mutually exclusive"), std::string::npos);
}

// Test: Unknown command logs an error, prints usage and fails
TEST_F(CommandInvokerTest, RunUnknownCommand) {
    CommandInvoker invoker;
    EXPECT_EQ(invoker.run(ctx, {"frobnicate"}), 1);
    EXPECT_NE(errorStream.str().find("Unknown command: frobnicate"), std::string::npos);
    EXPECT_NE(getOutput().find("usage: gitquery"), std::string::npos);
}

// Test: No arguments prints usage
TEST_F(CommandInvokerTest, RunWithoutArguments) {
    CommandInvoker invoker;
    EXPECT_EQ(invoker.run(ctx, {}), 0);
    EXPECT_NE(getOutput().find("usage: gitquery"), std::string::npos);
    EXPECT_NE(getOutput().find("status"), std::string::npos);
}

// Test: Help topic prints the command's manual
TEST_F(CommandInvokerTest, HelpTopic) {
    HelpCommand help;
    ASSERT_TRUE(help.execute(ctx, {"status"}).has_value());
    EXPECT_NE(getOutput().find("NAME:\nstatus"), std::string::npos);
    EXPECT_NE(getOutput().find("SYNOPSIS:"), std::string::npos);
    EXPECT_NE(getOutput().find("--untracked"), std::string::npos);
}

// Test: Argument parsing keeps flags, values and positionals apart
TEST_F(CommandInvokerTest, CommandArgsParse) {
    auto parsed = CommandArgs::parse({"--oneline", "--author", "Jane", "HEAD"}, {"--oneline"}, {"--author"}, 1);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed.value().has("--oneline"));
    EXPECT_TRUE(parsed.value().has("--author"));
    EXPECT_EQ(*parsed.value().value("--author"), "Jane");
    ASSERT_EQ(parsed.value().positionals().size(), 1u);
    EXPECT_EQ(parsed.value().positionals()[0], "HEAD");
    EXPECT_FALSE(parsed.value().value("--grep").has_value());

    auto extra = CommandArgs::parse({"a", "b"}, {}, {}, 1);
    ASSERT_FALSE(extra.has_value());
    EXPECT_EQ(extra.error().message, "unexpected argument 'b'");
}

// Test: Input comes from --file when given, else the context stream
TEST_F(CommandInvokerTest, ReadInputSources) {
    fs::path dir = createTempDir();
    fs::path file = createFile(dir, "log.txt", "from file\n");
    input.str("from stdin\n");

    auto fromFile = CommandArgs::parse({"--file", file.string()}, {}, {});
    ASSERT_TRUE(fromFile.has_value());
    auto text = readInput(ctx, fromFile.value());
    removeDir(dir);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(text.value(), "from file\n");

    auto fromStream = readInput(ctx, CommandArgs::parse({}, {}, {}).value());
    ASSERT_TRUE(fromStream.has_value());
    EXPECT_EQ(fromStream.value(), "from stdin\n");

    AppContext noInput;
    noInput.input = nullptr;
    auto none = readInput(noInput, CommandArgs::parse({}, {}, {}).value());
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code, ErrorCode::InvalidArgs);
}
