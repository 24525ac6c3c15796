#include <gtest/gtest.h>
#include <regex>
#include <set>
#include <strata/types.hpp>

using namespace strata;

namespace
{

PermissionRequest request_for(const std::string& tool, std::map<std::string, std::string> input,
                              std::optional<std::string> cwd = std::nullopt)
{
    PermissionRequest request;
    request.id = "r1";
    request.tool_name = tool;
    request.input_summary = std::move(input);
    request.working_directory = std::move(cwd);
    return request;
}

} // namespace

TEST(PermissionRequestTest, DisplayDescription)
{
    EXPECT_EQ(request_for("Bash", {{"command", "rm -rf build"}}).display_description(),
              "rm -rf build");
    EXPECT_EQ(request_for("Bash", {}).display_description(), "Run a command");
    EXPECT_EQ(request_for("Edit", {{"file_path", "/p/a.txt"}}).display_description(),
              "Edit /p/a.txt");
    EXPECT_EQ(request_for("Write", {{"file_path", "/p/b.txt"}, {"contentLength", "42"}})
                  .display_description(),
              "Write to /p/b.txt (42 chars)");
    EXPECT_EQ(request_for("Read", {}).display_description(), "Read a file");
    EXPECT_EQ(request_for("WebFetch", {{"url", "x"}}).display_description(), "WebFetch");
}

TEST(PermissionRequestTest, InsideWorkingDirectory)
{
    EXPECT_FALSE(
        request_for("Edit", {{"file_path", "/project/src/a.cpp"}}, std::string("/project"))
            .is_outside_working_directory());
    EXPECT_FALSE(request_for("Edit", {{"file_path", "src/a.cpp"}}, std::string("/project/"))
                     .is_outside_working_directory());
    EXPECT_FALSE(request_for("Glob", {{"path", "/project"}}, std::string("/project"))
                     .is_outside_working_directory());
}

TEST(PermissionRequestTest, SiblingWithSharedPrefixIsOutside)
{
    EXPECT_TRUE(request_for("Edit", {{"file_path", "/projectEVIL/a.cpp"}}, std::string("/project"))
                    .is_outside_working_directory());
}

TEST(PermissionRequestTest, DotDotEscapeIsOutside)
{
    EXPECT_TRUE(
        request_for("Write", {{"file_path", "/project/../etc/passwd"}}, std::string("/project"))
            .is_outside_working_directory());
    EXPECT_TRUE(request_for("Write", {{"file_path", "../secret"}}, std::string("/project"))
                    .is_outside_working_directory());
}

TEST(PermissionRequestTest, NoPathOrNoCwdIsInside)
{
    EXPECT_FALSE(request_for("Bash", {{"command", "ls /"}}, std::string("/project"))
                     .is_outside_working_directory());
    EXPECT_FALSE(request_for("Edit", {{"file_path", "/etc/hosts"}}).is_outside_working_directory());
}

TEST(PermissionRequestTest, RootWorkingDirectoryContainsEverything)
{
    EXPECT_FALSE(request_for("Edit", {{"file_path", "/etc/hosts"}}, std::string("/"))
                     .is_outside_working_directory());
}

TEST(TypesTest, UuidFormatAndUniqueness)
{
    const std::regex pattern("^[0-9A-F]{8}-[0-9A-F]{4}-4[0-9A-F]{3}-[89AB][0-9A-F]{3}-[0-9A-F]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i)
    {
        std::string id = generate_uuid();
        EXPECT_TRUE(std::regex_match(id, pattern)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(TypesTest, NameRoundTrips)
{
    for (Role role : {Role::User, Role::Assistant, Role::System, Role::Tool})
        EXPECT_EQ(role_from_name(role_name(role)), role);
    EXPECT_FALSE(role_from_name("narrator").has_value());

    for (TaskStatus status :
         {TaskStatus::Pending, TaskStatus::InProgress, TaskStatus::Completed, TaskStatus::Deleted})
        EXPECT_EQ(task_status_from_name(task_status_name(status)), status);
    EXPECT_FALSE(task_status_from_name("blocked").has_value());

    EXPECT_EQ(diff_line_kind_from_name("addition"), DiffLineKind::Addition);
    EXPECT_EQ(diff_line_kind_from_name("???"), DiffLineKind::Ellipsis);
}

TEST(TypesTest, ChatMessageGetsIdAndTimestamp)
{
    auto before = Clock::now();
    ChatMessage message(Role::System, "hi");
    EXPECT_FALSE(message.id.empty());
    EXPECT_GE(message.timestamp, before);
    EXPECT_FALSE(message.tool_activity.has_value());
}

TEST(TypesTest, UsageTotalInputTokens)
{
    UsageInfo usage;
    usage.input_tokens = 3;
    usage.cache_read_tokens = 40;
    usage.cache_creation_tokens = 5;
    EXPECT_EQ(usage.total_input_tokens(), 48);
}
