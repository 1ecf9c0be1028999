#include <gtest/gtest.h>
#include <context/role_instructions.hpp>
#include "test_helpers.hpp"
#include <fstream>

class RoleInstructionsTest : public ::testing::Test {
protected:
    TempDir user{"roles_user"};
    TempDir project{"roles_project"};

    void write(const TempDir& d, const std::string& file, const std::string& text) {
        std::ofstream(d.path() / file) << text;
    }

    RoleInstructions roles() const {
        return RoleInstructions({user.path(), project.path()});
    }
};

TEST_F(RoleInstructionsTest, RoleFileWins) {
    write(project, "backend.md", "Own the API.");
    write(project, "general.md", "Be helpful.");
    EXPECT_EQ(roles().load("backend"), "Own the API.");
}

TEST_F(RoleInstructionsTest, EarlierDirectoryTakesPrecedence) {
    write(user, "backend.md", "user copy");
    write(project, "backend.md", "project copy");
    EXPECT_EQ(roles().load("backend"), "user copy");
}

TEST_F(RoleInstructionsTest, FallsBackToGeneral) {
    write(project, "general.md", "Be helpful.");
    EXPECT_EQ(roles().load("designer"), "Be helpful.");
}

TEST_F(RoleInstructionsTest, NothingFoundIsEmpty) {
    EXPECT_EQ(roles().load("backend"), "");
}

TEST_F(RoleInstructionsTest, PathLikeRoleNamesIgnored) {
    write(user, "general.md", "general");
    write(project, "escape.md", "outside");
    EXPECT_EQ(roles().load("../" + project.path().filename().string() + "/escape"), "general");
    EXPECT_EQ(roles().load(".."), "general");
}

TEST_F(RoleInstructionsTest, AvailableRolesMergesDirectories) {
    write(user, "architect.md", "a");
    write(project, "tester.md", "t");
    write(project, "architect.md", "a2");
    write(project, "notes.txt", "ignored");
    EXPECT_EQ(roles().available_roles(), (std::vector<std::string>{"architect", "tester"}));
}
