//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Tests for the builtin `os` module against a scratch directory.
//
//===----------------------------------------------------------------------===//

#include "tests/nikl/NiklTestUtils.hpp"

#include <cstdlib>

using nikl::test::runScript;
using nikl::test::TempDir;

namespace
{

/// Prefix every script with the os import and a `root` binding for @p dir.
std::string withRoot(const TempDir &dir, const std::string &body)
{
    return "import \"os\" as os\nlet root = \"" + dir.path().generic_string() + "\"\n" + body;
}

} // namespace

TEST(NiklOsModule, WriteThenRead)
{
    TempDir dir;
    auto run = runScript(withRoot(dir, R"(
let file = root + "/note.txt"
os.write_file(file, "hello")
print(os.read_file(file), os.exists(file), os.is_file(file), os.is_dir(file))
)"));
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "hello True True False\n");
}

TEST(NiklOsModule, MutatingCallsReturnNone)
{
    TempDir dir;
    auto run = runScript(withRoot(dir, "os.make_dir(root + \"/sub\")"));
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_TRUE(run.value.isNull());
}

TEST(NiklOsModule, MakeDirIsRecursiveAndListingIsSorted)
{
    TempDir dir;
    dir.write("b.txt", "b");
    dir.write("a.txt", "a");
    auto run = runScript(withRoot(dir, R"(
os.make_dir(root + "/x/y/z")
print(os.is_dir(root + "/x/y/z"))
print(os.list_dir(root))
)"));
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "True\n[a.txt, b.txt, x]\n");
}

TEST(NiklOsModule, RemoveAndRename)
{
    TempDir dir;
    dir.write("old.txt", "data");
    dir.write("tree/leaf.txt", "leaf");
    auto run = runScript(withRoot(dir, R"(
os.rename(root + "/old.txt", root + "/new.txt")
print(os.exists(root + "/old.txt"), os.read_file(root + "/new.txt"))
os.remove_file(root + "/new.txt")
os.remove_dir(root + "/tree")
print(os.list_dir(root))
)"));
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "False data\n[]\n");
}

TEST(NiklOsModule, HostFailuresNameTheFunction)
{
    TempDir dir;
    auto removal = runScript(withRoot(dir, "os.remove_file(root + \"/missing\")"));
    ASSERT_FALSE(removal.ok);
    EXPECT_EQ(removal.error.rfind("os.remove_file: ", 0), 0u) << removal.error;

    auto read = runScript(withRoot(dir, "os.read_file(root + \"/missing\")"));
    ASSERT_FALSE(read.ok);
    EXPECT_EQ(read.error.rfind("os.read_file: unable to open", 0), 0u) << read.error;

    dir.write("plain.txt", "x");
    auto notDir = runScript(withRoot(dir, "os.remove_dir(root + \"/plain.txt\")"));
    ASSERT_FALSE(notDir.ok);
    EXPECT_NE(notDir.error.find("not a directory"), std::string::npos) << notDir.error;
}

TEST(NiklOsModule, WorkingDirectory)
{
    TempDir dir;
    const auto saved = std::filesystem::current_path();

    auto run = runScript(withRoot(dir, R"(
os.set_cwd(root)
os.write_file("relative.txt", "here")
print(os.read_file(os.get_cwd() + "/relative.txt"))
)"));
    std::filesystem::current_path(saved);

    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "here\n");
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "relative.txt"));
}

TEST(NiklOsModule, EnvironmentVariables)
{
    auto run = runScript(R"(
import "os" as os
os.env_set("NIKL_TEST_VARIABLE", "on")
print(os.env_get("NIKL_TEST_VARIABLE"), os.env_get("NIKL_TEST_UNSET_VARIABLE"))
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "on None\n");
    EXPECT_STREQ(std::getenv("NIKL_TEST_VARIABLE"), "on");
}

TEST(NiklOsModule, ArgumentChecks)
{
    auto badType = runScript("import \"os\" as os\nos.exists(5)");
    ASSERT_FALSE(badType.ok);
    EXPECT_EQ(badType.error, "exists expects a string path");

    auto badArity = runScript("import \"os\" as os\nos.get_cwd(1)");
    ASSERT_FALSE(badArity.ok);
    EXPECT_EQ(badArity.error, "get_cwd() takes exactly zero arguments, but got 1");
}

TEST(NiklOsModule, ModuleIsARecordOfBuiltins)
{
    auto run = runScript("import \"os\" as os\nprint(len(os), type(os), type(os.rename))");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "14 HashMap BuiltinFunction\n");
}
