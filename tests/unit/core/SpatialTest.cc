#include "spill/core/Spatial.hh"
#include <gtest/gtest.h>
#include <array>
#include <cmath>
#include <limits>
#include <numbers>

using namespace spill;

template <typename T>
bool almostEqual(T a, T b, T epsilon = static_cast<T>(1e-4)) {
    return std::abs(a - b) <= epsilon;
}

static bool vecNear(const Vec3f& a, const Vec3f& b, float eps = 1e-4f) {
    return almostEqual(a.x, b.x, eps) && almostEqual(a.y, b.y, eps) && almostEqual(a.z, b.z, eps);
}

class SpatialTest : public ::testing::Test {};

TEST_F(SpatialTest, Vector3Arithmetic) {
    Vec3f a(1.0f, 2.0f, 3.0f);
    Vec3f b(4.0f, 5.0f, 6.0f);

    EXPECT_EQ(a + b, Vec3f(5.0f, 7.0f, 9.0f));
    EXPECT_EQ(b - a, Vec3f(3.0f, 3.0f, 3.0f));
    EXPECT_EQ(-a, Vec3f(-1.0f, -2.0f, -3.0f));
    EXPECT_EQ(a * 2.0f, Vec3f(2.0f, 4.0f, 6.0f));
    EXPECT_FLOAT_EQ(a.dot(b), 32.0f);
    EXPECT_EQ(Vec3f(1, 0, 0).cross(Vec3f(0, 1, 0)), Vec3f(0, 0, 1));
}

TEST_F(SpatialTest, Vector3LengthAndNormalize) {
    Vec3f v(2.0f, 3.0f, 4.0f);
    EXPECT_FLOAT_EQ(v.lengthSquared(), 29.0f);
    EXPECT_TRUE(almostEqual(v.normalized().length(), 1.0f));

    Vec3f zero;
    EXPECT_EQ(zero.normalized(), Vec3f(0, 0, 0));
}

TEST_F(SpatialTest, Vector3Finiteness) {
    EXPECT_TRUE(Vec3f(1, 2, 3).isFinite());
    EXPECT_FALSE(Vec3f(std::nanf(""), 0, 0).isFinite());
    EXPECT_FALSE(Vec3f(0, std::numeric_limits<float>::infinity(), 0).isFinite());
}

TEST_F(SpatialTest, Vector3Lerp) {
    Vec3f a(0.0f, 0.0f, 0.0f);
    Vec3f b(10.0f, 20.0f, 30.0f);
    EXPECT_EQ(Vec3f::lerp(a, b, 0.0f), a);
    EXPECT_EQ(Vec3f::lerp(a, b, 1.0f), b);
    EXPECT_EQ(Vec3f::lerp(a, b, 0.5f), Vec3f(5.0f, 10.0f, 15.0f));
}

TEST_F(SpatialTest, QuaternionAxisAngleRotation) {
    Quatf q = Quatf::fromAxisAngle(Vec3f(0, 0, 1), std::numbers::pi_v<float> / 2.0f);
    EXPECT_TRUE(vecNear(q.rotateVector(Vec3f(1, 0, 0)), Vec3f(0, 1, 0)));
}

TEST_F(SpatialTest, QuaternionConjugateUndoesRotation) {
    Quatf q = Quatf::fromAxisAngle(Vec3f(1, 1, 0).normalized(), 0.7f);
    Vec3f v(0.3f, -2.0f, 1.5f);
    EXPECT_TRUE(vecNear(q.conjugate().rotateVector(q.rotateVector(v)), v));
}

TEST_F(SpatialTest, LookRotationPointsForwardAlongNegativeZ) {
    Vec3f forward = Vec3f(1.0f, -1.0f, 0.5f).normalized();
    Quatf q = Quatf::lookRotation(forward, Vec3f(0, 1, 0));
    EXPECT_TRUE(vecNear(q.rotateVector(Vec3f(0, 0, -1)), forward));
}

TEST_F(SpatialTest, LookRotationHandlesForwardParallelToUp) {
    Quatf q = Quatf::lookRotation(Vec3f(0, 1, 0), Vec3f(0, 1, 0));
    EXPECT_TRUE(vecNear(q.rotateVector(Vec3f(0, 0, -1)), Vec3f(0, 1, 0)));
    EXPECT_TRUE(almostEqual(q.length(), 1.0f));
}

TEST_F(SpatialTest, TiltedLookRotationMapsLocalUpOntoNormal) {
    Quatf tilt = Quatf::fromAxisAngle(Vec3f(1, 0, 0), -std::numbers::pi_v<float> / 2.0f);
    for (const Vec3f& normal : {Vec3f(0, 1, 0), Vec3f(1, 0, 0), Vec3f(0, 0, -1), Vec3f(0.6f, 0.8f, 0.0f)}) {
        Quatf q = Quatf::lookRotation(normal, Vec3f(0, 1, 0)) * tilt;
        EXPECT_TRUE(vecNear(q.rotateVector(Vec3f(0, 1, 0)), normal));
    }
}

TEST_F(SpatialTest, QuaternionSlerpMidpoint) {
    Vec3f axis(0.0f, 0.0f, 1.0f);
    Quatf a = Quatf::fromAxisAngle(axis, 0.0f);
    Quatf b = Quatf::fromAxisAngle(axis, std::numbers::pi_v<float> / 2.0f);
    Quatf mid = Quatf::slerp(a, b, 0.5f);
    Quatf expected = Quatf::fromAxisAngle(axis, std::numbers::pi_v<float> / 4.0f);

    EXPECT_TRUE(almostEqual(mid.z, expected.z));
    EXPECT_TRUE(almostEqual(mid.w, expected.w));
}

TEST_F(SpatialTest, MatrixInverse) {
    Matrix4x4<float> m = Matrix4x4<float>::translation(Vec3f(1, 2, 3)) *
                         Matrix4x4<float>::rotation(Quatf::fromAxisAngle(Vec3f(0, 1, 0), 0.5f));
    Matrix4x4<float> identity = m * m.inverse();
    for (int r = 0; r < 4; ++r) {
        for (int c = 0; c < 4; ++c) {
            EXPECT_TRUE(almostEqual(identity(r, c), r == c ? 1.0f : 0.0f));
        }
    }
}

TEST_F(SpatialTest, SingularMatrixInverseIsIdentity) {
    Matrix4x4<float> zero(std::array<float, 16>{});
    Matrix4x4<float> inv = zero.inverse();
    EXPECT_FLOAT_EQ(inv(0, 0), 1.0f);
    EXPECT_FLOAT_EQ(inv(0, 1), 0.0f);
}

TEST_F(SpatialTest, TransformPointIsRotationThenTranslation) {
    Transformf t(Vec3f(10, 0, 0), Quatf::fromAxisAngle(Vec3f(0, 0, 1), std::numbers::pi_v<float> / 2.0f));
    Vector3<float, Space::Local> local(1, 0, 0);
    EXPECT_TRUE(vecNear(t.transformPoint(local), Vec3f(10, 1, 0)));
    EXPECT_TRUE(vecNear(t.upVector(), Vec3f(-1, 0, 0)));
}

TEST_F(SpatialTest, TransformCompositionAndInverse) {
    Transformf parent(Vec3f(2, 1, 0), Quatf::fromAxisAngle(Vec3f(0, 1, 0), 0.8f));
    Transformf child(Vec3f(0.5f, 0.2f, -1.0f), Quatf::fromAxisAngle(Vec3f(1, 0, 0), 0.3f));

    Transformf world = parent * child;
    Transformf offset = parent.inverse() * world;

    EXPECT_TRUE(vecNear(offset.getPosition(), child.getPosition()));
    EXPECT_TRUE(vecNear(offset.getRotation().rotateVector(Vec3f(0, 1, 0)),
                        child.getRotation().rotateVector(Vec3f(0, 1, 0))));
}

TEST_F(SpatialTest, TransformFromMatrixRoundTrip) {
    Transformf t(Vec3f(-3, 4, 5), Quatf::fromAxisAngle(Vec3f(0, 0, 1), 1.1f));
    Transformf rebuilt = Transformf::fromMatrix(t.getMatrix());
    EXPECT_TRUE(vecNear(rebuilt.getPosition(), t.getPosition()));
    EXPECT_TRUE(vecNear(rebuilt.lookVector(), t.lookVector()));
}
