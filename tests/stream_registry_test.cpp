#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "relay_errors.hpp"
#include "stream_registry.hpp"

namespace {

std::shared_ptr<RelaySession> session_for(const std::string& id, RelayRole role = RelayRole::UPLOADER,
		const std::string& token = "")
{
	return std::make_shared<RelaySession>(id, role, token);
}

}

TEST(StreamRegistryTest, ClaimHandsOverTheWaitingSession)
{
	StreamRegistry registry;
	auto upload = session_for("report.pdf");
	registry.register_session(upload);
	EXPECT_EQ(registry.size(), 1u);

	auto claimed = registry.claim("report.pdf", RelayRole::DOWNLOADER, "");
	EXPECT_EQ(claimed, upload);
	EXPECT_EQ(registry.size(), 0u);

	EXPECT_THROW(registry.claim("report.pdf", RelayRole::DOWNLOADER, ""), NotFoundError);
}

TEST(StreamRegistryTest, DuplicateRegistrationConflicts)
{
	StreamRegistry registry;
	auto first = session_for("a");
	registry.register_session(first);

	EXPECT_THROW(registry.register_session(session_for("a")), ConflictError);

	// the original entry is untouched
	EXPECT_EQ(registry.claim("a", RelayRole::DOWNLOADER, ""), first);
}

TEST(StreamRegistryTest, UnknownFileIdIsNotFound)
{
	StreamRegistry registry;
	registry.register_session(session_for("a"));

	EXPECT_THROW(registry.claim("b", RelayRole::DOWNLOADER, ""), NotFoundError);
	EXPECT_EQ(registry.size(), 1u);
}

TEST(StreamRegistryTest, SameSideClaimConflictsAndKeepsEntry)
{
	StreamRegistry registry;
	registry.register_session(session_for("a"));

	EXPECT_THROW(registry.claim("a", RelayRole::UPLOADER, ""), ConflictError);
	EXPECT_EQ(registry.size(), 1u);
}

TEST(StreamRegistryTest, ForeignTokenIsForbiddenAndKeepsEntry)
{
	StreamRegistry registry;
	auto upload = session_for("a", RelayRole::UPLOADER, "owner");
	registry.register_session(upload);

	EXPECT_THROW(registry.claim("a", RelayRole::DOWNLOADER, "intruder"), ForbiddenError);
	EXPECT_THROW(registry.claim("a", RelayRole::DOWNLOADER, ""), ForbiddenError);
	EXPECT_EQ(registry.size(), 1u);

	EXPECT_EQ(registry.claim("a", RelayRole::DOWNLOADER, "owner"), upload);
}

TEST(StreamRegistryTest, ReleaseHookRunsOnceWhenEntryLeaves)
{
	StreamRegistry registry;
	auto upload = session_for("a");

	int released = 0;
	upload->set_release_hook([&released] { released++; });
	registry.register_session(upload);

	EXPECT_EQ(released, 0);
	registry.claim("a", RelayRole::DOWNLOADER, "");
	EXPECT_EQ(released, 1);

	EXPECT_FALSE(registry.remove(upload));
	upload->release();
	EXPECT_EQ(released, 1);
}

TEST(StreamRegistryTest, RemoveOnlyTakesTheCallersOwnSession)
{
	StreamRegistry registry;
	auto original = session_for("a");
	registry.register_session(original);

	auto stale = session_for("a");
	EXPECT_FALSE(registry.remove(stale));
	EXPECT_EQ(registry.size(), 1u);

	EXPECT_TRUE(registry.remove(original));
	EXPECT_EQ(registry.size(), 0u);

	// the FileId is free again
	EXPECT_NO_THROW(registry.register_session(session_for("a")));
}

TEST(StreamRegistryTest, RendezvousPairsOppositeSides)
{
	StreamRegistry registry;

	auto download = session_for("clip.mov", RelayRole::DOWNLOADER);
	auto first = registry.rendezvous(download);
	EXPECT_FALSE(first.claimed);
	EXPECT_EQ(first.session, download);
	EXPECT_EQ(registry.size(), 1u);

	auto upload = session_for("clip.mov", RelayRole::UPLOADER);
	auto second = registry.rendezvous(upload);
	EXPECT_TRUE(second.claimed);
	EXPECT_EQ(second.session, download);
	EXPECT_EQ(registry.size(), 0u);
}

TEST(StreamRegistryTest, RendezvousSameSideConflicts)
{
	StreamRegistry registry;
	registry.rendezvous(session_for("a", RelayRole::DOWNLOADER));

	EXPECT_THROW(registry.rendezvous(session_for("a", RelayRole::DOWNLOADER)), ConflictError);
	EXPECT_EQ(registry.size(), 1u);
}

TEST(StreamRegistryTest, ListsActiveStreamsSorted)
{
	StreamRegistry registry;
	registry.register_session(session_for("zeta"));
	registry.register_session(session_for("alpha", RelayRole::UPLOADER, "tok"));
	registry.register_session(session_for("mid", RelayRole::DOWNLOADER));

	std::vector<std::string> expected = {"alpha", "mid", "zeta"};
	EXPECT_EQ(registry.list_active(), expected);

	auto snapshot = registry.snapshot();
	ASSERT_EQ(snapshot.size(), 3u);
	EXPECT_EQ(snapshot[0].file_id, "alpha");
	EXPECT_TRUE(snapshot[0].token_bound);
	EXPECT_EQ(snapshot[1].waiting_side, RelayRole::DOWNLOADER);
	EXPECT_FALSE(snapshot[2].token_bound);
}
