#include "pc/peer_connection_registry.hpp"
#include "common/task_queue.hpp"
#include "testing/fake_media_engine.hpp"
#include "testing/queue_helpers.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

using namespace testing;

namespace naivecall {
namespace test {

class T(PeerConnectionRegistryTest) : public ::testing::Test {
protected:
    T(PeerConnectionRegistryTest)() 
        : queue_("PeerConnectionRegistryTest.queue"),
          engine_("u2", &queue_) {
        registry_ = std::make_unique<PeerConnectionRegistry>("u2", std::vector<std::string>({"u3", "u1", "u2", "u3"}), 
            [this](const std::string& remote_user_id) {
                ++created_;
                PeerConnection::Configuration config;
                config.local_user_id = "u2";
                config.remote_user_id = remote_user_id;
                config.offer_retransmit_interval_ms = 0;
                return PeerConnection::Create(config, 
                                              engine_.CreateTransport(RtcConfiguration::Default(), remote_user_id, &queue_), 
                                              &queue_, 
                                              std::weak_ptr<PeerConnection::Observer>());
            });
    }

    ~T(PeerConnectionRegistryTest)() override {
        queue_.Sync([this](){ registry_.reset(); });
    }

    TaskQueue queue_;
    FakeMediaEngine engine_;
    int created_ = 0;
    std::unique_ptr<PeerConnectionRegistry> registry_;
};

MY_TEST_F(PeerConnectionRegistryTest, RosterExcludesTheLocalUser) {
    EXPECT_EQ(registry_->remote_participants(), std::vector<std::string>({"u1", "u3"}));
    EXPECT_TRUE(registry_->IsRemoteParticipant("u1"));
    EXPECT_FALSE(registry_->IsRemoteParticipant("u2"));
    EXPECT_FALSE(registry_->IsRemoteParticipant("u4"));
}

MY_TEST_F(PeerConnectionRegistryTest, CreatesOneConnectionPerParticipant) {
    queue_.Sync([this](){
        auto first = registry_->GetOrCreate("u1");
        ASSERT_NE(first, nullptr);
        EXPECT_EQ(registry_->GetOrCreate("u1"), first);
        EXPECT_EQ(registry_->Find("u1"), first);
        EXPECT_EQ(registry_->Find("u3"), nullptr);
        EXPECT_EQ(registry_->GetOrCreate("u2"), nullptr);
        EXPECT_EQ(registry_->GetOrCreate("stranger"), nullptr);
    });
    EXPECT_EQ(created_, 1);
    EXPECT_EQ(registry_->size(), 1u);
}

MY_TEST_F(PeerConnectionRegistryTest, AttachLocalMediaIsIdempotentPerTrack) {
    MediaStream stream("local");
    stream.AddTrack(std::make_shared<MediaTrack>(MediaTrack::Kind::AUDIO, "mic"));
    stream.AddTrack(std::make_shared<MediaTrack>(MediaTrack::Kind::VIDEO, "camera"));
    queue_.Sync([&](){
        auto peer_connection = registry_->GetOrCreate("u3");
        EXPECT_EQ(registry_->AttachLocalMedia(peer_connection, stream), 2u);
        EXPECT_EQ(registry_->AttachLocalMedia(peer_connection, stream), 0u);
        EXPECT_TRUE(peer_connection->local_media_attached());
    });
    EXPECT_EQ(engine_.transport_for("u3")->added_track_ids, std::vector<std::string>({"mic", "camera"}));
}

MY_TEST_F(PeerConnectionRegistryTest, RemoteMediaIsReportedWithItsSender) {
    std::vector<std::pair<std::string, std::string>> remote_tracks;
    queue_.Sync([&](){
        registry_->GetOrCreate("u1");
        registry_->OnRemoteMediaAttached([&](const std::string& remote_user_id, std::shared_ptr<MediaTrack> track){
            remote_tracks.emplace_back(remote_user_id, track->track_id());
        });
        registry_->GetOrCreate("u3");
        registry_->Find("u1")->HandleRemoteOffer("offer from u1");
        registry_->Find("u3")->HandleRemoteOffer("offer from u3");
    });
    DrainQueues({&queue_});
    ASSERT_EQ(remote_tracks.size(), 2u);
    EXPECT_EQ(remote_tracks[0], std::make_pair(std::string("u1"), std::string("remote-audio-u1")));
    EXPECT_EQ(remote_tracks[1], std::make_pair(std::string("u3"), std::string("remote-audio-u3")));
    queue_.Sync([this](){ registry_->CloseAll(); });
}

MY_TEST_F(PeerConnectionRegistryTest, CloseAllClosesConnectionsThatNeverLeftNew) {
    queue_.Sync([this](){
        registry_->GetOrCreate("u1");
        registry_->GetOrCreate("u3");
        EXPECT_FALSE(registry_->AllClosed());
        registry_->CloseAll();
        registry_->CloseAll();
        EXPECT_TRUE(registry_->closed());
        EXPECT_TRUE(registry_->AllClosed());
        EXPECT_EQ(registry_->GetOrCreate("u1"), nullptr);
    });
    EXPECT_TRUE(engine_.transport_for("u1")->closed);
    EXPECT_TRUE(engine_.transport_for("u3")->closed);
}

MY_TEST_F(PeerConnectionRegistryTest, AllClosedTracksEveryConnection) {
    queue_.Sync([this](){
        EXPECT_TRUE(registry_->AllClosed());
        registry_->GetOrCreate("u1")->Close();
        registry_->GetOrCreate("u3");
        EXPECT_FALSE(registry_->AllClosed());
        registry_->Find("u3")->Close();
        EXPECT_TRUE(registry_->AllClosed());
    });
}

} // namespace test
} // namespace naivecall
