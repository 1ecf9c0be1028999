#include <gtest/gtest.h>
#include <context/agent_context.hpp>

TEST(AgentContextTest, NewContextIsEmpty) {
    AgentContext ctx("abcd1234", 2, "backend", "backend");
    EXPECT_EQ(ctx.agent_id(), 2);
    EXPECT_EQ(ctx.role(), "backend");
    EXPECT_FALSE(ctx.resume_token().has_value());
    EXPECT_FALSE(ctx.in_worktree());
    EXPECT_FALSE(ctx.created_at().empty());
}

TEST(AgentContextTest, SetWorktreeClearsResumeToken) {
    AgentContext ctx("abcd1234", 3, "tester", "tester");
    ctx.set_resume_token("sess-1");
    ASSERT_TRUE(ctx.resume_token().has_value());

    ctx.set_worktree("feature-x", "/repo/.crew/worktrees/feature-x");
    EXPECT_FALSE(ctx.resume_token().has_value());
    EXPECT_EQ(ctx.worktree_branch().value_or(""), "feature-x");
    EXPECT_EQ(ctx.worktree_path().value_or(""), "/repo/.crew/worktrees/feature-x");
    EXPECT_TRUE(ctx.in_worktree());
}

TEST(AgentContextTest, ClearWorktreeClearsTokenToo) {
    AgentContext ctx("abcd1234", 0, "architect", "architect");
    ctx.set_worktree("feature-x", "/wt");
    ctx.set_resume_token("sess-2");

    ctx.clear_worktree();
    EXPECT_FALSE(ctx.in_worktree());
    EXPECT_FALSE(ctx.worktree_branch().has_value());
    EXPECT_FALSE(ctx.resume_token().has_value());
}

TEST(AgentContextTest, RoleChangeKeepsToken) {
    AgentContext ctx("abcd1234", 1, "frontend", "frontend");
    ctx.set_resume_token("sess-3");
    ctx.set_role("reviewer");
    EXPECT_EQ(ctx.role(), "reviewer");
    EXPECT_EQ(ctx.resume_token().value_or(""), "sess-3");
}

TEST(SharedContextTest, DecisionsFilteredByExpertAndTopic) {
    SharedContext shared;
    auto all = make_decision(0, "API shape", "REST", "simple");
    auto backend_only = make_decision(0, "Database", "Postgres", "familiar");
    backend_only.affects_experts = {2};
    shared.decisions = {all, backend_only};

    EXPECT_EQ(shared.decisions_for_expert(1).size(), 1u);
    EXPECT_EQ(shared.decisions_for_expert(2).size(), 2u);

    auto db = shared.decisions_by_topic("database");
    ASSERT_EQ(db.size(), 1u);
    EXPECT_EQ(db[0].decision, "Postgres");
    EXPECT_NE(all.id, backend_only.id);
}

TEST(SessionRolesTest, SetRoleReplacesExistingAssignment) {
    SessionRoles roles = make_session_roles("abcd1234");
    EXPECT_FALSE(roles.get_role(0).has_value());

    roles.set_role(0, "architect");
    roles.set_role(0, "reviewer");
    roles.set_role(1, "frontend");

    EXPECT_EQ(roles.assignments.size(), 2u);
    EXPECT_EQ(roles.get_role(0).value_or(""), "reviewer");
    EXPECT_EQ(roles.get_role(1).value_or(""), "frontend");
}
