#include "spill/core/NeighborQuery.hh"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using namespace spill;

class NeighborQueryTest : public ::testing::Test {
  protected:
    // A pool resting at `position`, ready to merge into.
    DropletObject* landedPool(ObjectId id, const Vec3f& position) {
        auto obj = std::make_unique<DropletObject>(id, DropletTemplate{});
        obj->setState(DropletState::Flying);
        obj->setState(DropletState::Landed);
        obj->setAnchored(true);
        obj->setParented(true);
        obj->setPosition(position);
        objects.push_back(std::move(obj));
        candidates.push_back(objects.back().get());
        return candidates.back();
    }

    std::vector<std::unique_ptr<DropletObject>> objects;
    std::vector<DropletObject*> candidates;
    DropletObject self{100, DropletTemplate{}};
};

TEST_F(NeighborQueryTest, EmptyCandidatesGiveNothing) {
    EXPECT_EQ(findNearestPool(candidates, self, Vec3f(0, 0, 0), 1.0f), nullptr);
}

TEST_F(NeighborQueryTest, FindsNearestWithinRadius) {
    landedPool(1, Vec3f(0.15f, 0, 0));
    DropletObject* near = landedPool(2, Vec3f(0.05f, 0, 0));
    landedPool(3, Vec3f(2.0f, 0, 0));

    EXPECT_EQ(findNearestPool(candidates, self, Vec3f(0, 0, 0), 0.2f), near);
}

TEST_F(NeighborQueryTest, RadiusIsExclusive) {
    landedPool(1, Vec3f(0.5f, 0, 0));
    EXPECT_EQ(findNearestPool(candidates, self, Vec3f(0, 0, 0), 0.5f), nullptr);
    EXPECT_EQ(findNearestPool(candidates, self, Vec3f(0, 0, 0), 0.0f), nullptr);
}

TEST_F(NeighborQueryTest, TiesGoToLowerId) {
    DropletObject* high = landedPool(9, Vec3f(0.1f, 0, 0));
    DropletObject* low = landedPool(4, Vec3f(-0.1f, 0, 0));
    EXPECT_EQ(findNearestPool(candidates, self, Vec3f(0, 0, 0), 1.0f), low);

    std::swap(candidates[0], candidates[1]);
    EXPECT_EQ(findNearestPool(candidates, self, Vec3f(0, 0, 0), 1.0f), low);
    (void)high;
}

TEST_F(NeighborQueryTest, SkipsIneligibleCandidates) {
    DropletObject* decaying = landedPool(1, Vec3f(0.01f, 0, 0));
    decaying->setState(DropletState::Decaying);

    DropletObject* expanding = landedPool(2, Vec3f(0.02f, 0, 0));
    expanding->setState(DropletState::Expanding);

    DropletObject* loose = landedPool(3, Vec3f(0.03f, 0, 0));
    loose->setAnchored(false);

    DropletObject* detached = landedPool(4, Vec3f(0.04f, 0, 0));
    detached->setParented(false);

    DropletObject* decal = landedPool(5, Vec3f(0.05f, 0, 0));
    decal->setKind(DropletKind::Decal);

    DropletObject* eligible = landedPool(6, Vec3f(0.09f, 0, 0));
    candidates.push_back(nullptr);

    EXPECT_EQ(findNearestPool(candidates, self, Vec3f(0, 0, 0), 1.0f), eligible);
}

TEST_F(NeighborQueryTest, SkipsPoolsWeldedToMovingSurfaces) {
    DropletObject* riding = landedPool(1, Vec3f(0.01f, 0, 0));
    riding->weldTo(7, Transformf());
    DropletObject* resting = landedPool(2, Vec3f(0.1f, 0, 0));

    EXPECT_EQ(findNearestPool(candidates, self, Vec3f(0, 0, 0), 1.0f), resting);

    resting->weldTo(7, Transformf());
    EXPECT_EQ(findNearestPool(candidates, self, Vec3f(0, 0, 0), 1.0f), nullptr);
}

TEST_F(NeighborQueryTest, NeverReturnsSelf) {
    self.setState(DropletState::Flying);
    self.setState(DropletState::Landed);
    self.setAnchored(true);
    self.setParented(true);
    candidates.push_back(&self);
    EXPECT_EQ(findNearestPool(candidates, self, self.position(), 1.0f), nullptr);
}

TEST_F(NeighborQueryTest, MatchesSelfKind) {
    self.setKind(DropletKind::Decal);
    landedPool(1, Vec3f(0.05f, 0, 0));
    DropletObject* decal = landedPool(2, Vec3f(0.1f, 0, 0));
    decal->setKind(DropletKind::Decal);
    EXPECT_EQ(findNearestPool(candidates, self, Vec3f(0, 0, 0), 1.0f), decal);
}
