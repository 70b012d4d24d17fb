#include <gtest/gtest.h>

#include <scenelink/workspace/DirectoryWorkspaceProvider.h>

using namespace scenelink;
using namespace scenelink::workspace;

namespace {

Workspace shotWorkspace() {
    Workspace ws;
    ws.name = "shotA";
    ws.root = "/proj/shotA";
    ws.entities = {{"seq01", "Sequence"}, {"seq01/shot010", "Shot"}, {"assets/chars/hero/", "Asset"}};
    ws.tasks = {"anim", "light"};
    return ws;
}

} // namespace

TEST(DirectoryWorkspaceProviderTest, EmptyPathIsInvalid) {
    DirectoryWorkspaceProvider provider({shotWorkspace()});
    auto ws = provider.workspaceFromPath("");
    ASSERT_FALSE(ws);
    EXPECT_EQ(ws.error().code, ErrorCode::InvalidArgument);
}

TEST(DirectoryWorkspaceProviderTest, PathOutsideWorkspacesIsNotFound) {
    DirectoryWorkspaceProvider provider({shotWorkspace()});
    auto ws = provider.workspaceFromPath("/proj/shotAB/scene.ext");
    ASSERT_FALSE(ws);
    EXPECT_EQ(ws.error().code, ErrorCode::NotFound);
}

TEST(DirectoryWorkspaceProviderTest, DeepestRootWins) {
    Workspace outer;
    outer.name = "proj";
    outer.root = "/proj";
    DirectoryWorkspaceProvider provider({outer, shotWorkspace()});

    auto ws = provider.workspaceFromPath("/proj/shotA/seq01/x.ext");
    ASSERT_TRUE(ws);
    EXPECT_EQ(ws.value().name, "shotA");

    auto other = provider.workspaceFromPath("/proj/shotB/x.ext");
    ASSERT_TRUE(other);
    EXPECT_EQ(other.value().name, "proj");
}

TEST(DirectoryWorkspaceProviderTest, DeepestEntityScopeIsChosen) {
    DirectoryWorkspaceProvider provider({shotWorkspace()});
    const std::string path = "/proj/shotA/seq01/shot010/scene.ext";
    auto ws = provider.workspaceFromPath(path);
    ASSERT_TRUE(ws);

    auto ctx = provider.contextFromPath(ws.value(), path, std::nullopt);
    ASSERT_TRUE(ctx);
    EXPECT_EQ(ctx.value(), (Context{"shotA", "Shot", "shot010", ""}));
}

TEST(DirectoryWorkspaceProviderTest, HintBreaksTiesBetweenScopes) {
    DirectoryWorkspaceProvider provider({shotWorkspace()});
    const std::string path = "/proj/shotA/seq01/shot010/scene.ext";
    const Workspace ws = shotWorkspace();

    auto ctx = provider.contextFromPath(ws, path, Context{"shotA", "Sequence", "seq01", ""});
    ASSERT_TRUE(ctx);
    EXPECT_EQ(ctx.value().entityType, "Sequence");
    EXPECT_EQ(ctx.value().entityName, "seq01");
}

TEST(DirectoryWorkspaceProviderTest, HintFromAnotherProjectIsIgnored) {
    DirectoryWorkspaceProvider provider({shotWorkspace()});
    const std::string path = "/proj/shotA/seq01/shot010/scene.ext";

    auto ctx = provider.contextFromPath(shotWorkspace(), path,
                                        Context{"other", "Sequence", "seq01", ""});
    ASSERT_TRUE(ctx);
    EXPECT_EQ(ctx.value().entityName, "shot010");
}

TEST(DirectoryWorkspaceProviderTest, TaskFolderBelowEntityIsDetected) {
    DirectoryWorkspaceProvider provider({shotWorkspace()});
    auto ctx = provider.contextFromPath(shotWorkspace(),
                                        "/proj/shotA/seq01/shot010/anim/v001.ext", std::nullopt);
    ASSERT_TRUE(ctx);
    EXPECT_EQ(ctx.value().task, "anim");

    auto noTask = provider.contextFromPath(shotWorkspace(),
                                           "/proj/shotA/seq01/shot010/misc/v001.ext",
                                           std::nullopt);
    ASSERT_TRUE(noTask);
    EXPECT_TRUE(noTask.value().task.empty());
}

TEST(DirectoryWorkspaceProviderTest, FileDirectlyInEntityHasNoTask) {
    DirectoryWorkspaceProvider provider({shotWorkspace()});
    // "anim" is the file itself here, not a folder
    auto ctx = provider.contextFromPath(shotWorkspace(), "/proj/shotA/seq01/shot010/anim",
                                        std::nullopt);
    ASSERT_TRUE(ctx);
    EXPECT_TRUE(ctx.value().task.empty());
}

TEST(DirectoryWorkspaceProviderTest, TrailingSlashInScopeIsHandled) {
    DirectoryWorkspaceProvider provider({shotWorkspace()});
    auto ctx = provider.contextFromPath(shotWorkspace(), "/proj/shotA/assets/chars/hero/rig.ext",
                                        std::nullopt);
    ASSERT_TRUE(ctx);
    EXPECT_EQ(ctx.value().entityType, "Asset");
    EXPECT_EQ(ctx.value().entityName, "hero");
}

TEST(DirectoryWorkspaceProviderTest, PathOutsideScopesGivesProjectOnlyContext) {
    DirectoryWorkspaceProvider provider({shotWorkspace()});
    auto ctx = provider.contextFromPath(shotWorkspace(), "/proj/shotA/notes.txt", std::nullopt);
    ASSERT_TRUE(ctx);
    EXPECT_EQ(ctx.value(), (Context{"shotA", "", "", ""}));
}

TEST(DirectoryWorkspaceProviderTest, ContextOutsideWorkspaceIsRejected) {
    DirectoryWorkspaceProvider provider({shotWorkspace()});
    auto ctx = provider.contextFromPath(shotWorkspace(), "/elsewhere/a.ext", std::nullopt);
    ASSERT_FALSE(ctx);
    EXPECT_EQ(ctx.error().code, ErrorCode::InvalidArgument);
}
