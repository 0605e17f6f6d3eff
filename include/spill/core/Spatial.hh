#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <type_traits>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_inverse.hpp>
#include <glm/gtc/type_ptr.hpp>

namespace spill {

template <typename T, typename SpaceTag> class Vector3;
template <typename T> class Matrix4x4;
template <typename T> class Quaternion;
template <typename T> class Transform;

/**
 * @brief Type tags for different coordinate spaces
 *
 * These tags are used to distinguish between different coordinate spaces
 * at compile time, preventing accidental mixing of spaces.
 */
namespace Space {
struct Local {}; // Object's local coordinate space (e.g. a weld offset)
struct World {}; // World-space coordinates
} // namespace Space

/**
 * @brief 3D vector class with coordinate space type safety
 *
 * @tparam T Numeric type (float, double, etc.)
 * @tparam Space Coordinate space tag
 */
template <typename T, typename SpaceTag = Space::World> class Vector3 {
  public:
    T x, y, z;

    Vector3() : x(0), y(0), z(0) {}
    Vector3(T x, T y, T z) : x(x), y(y), z(z) {}

    // Operators with the same space
    Vector3<T, SpaceTag> operator+(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(x + other.x, y + other.y, z + other.z);
    }

    Vector3<T, SpaceTag> operator-(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(x - other.x, y - other.y, z - other.z);
    }

    Vector3<T, SpaceTag> operator-() const { return Vector3<T, SpaceTag>(-x, -y, -z); }

    Vector3<T, SpaceTag> operator*(T scalar) const { return Vector3<T, SpaceTag>(x * scalar, y * scalar, z * scalar); }

    Vector3<T, SpaceTag> operator/(T scalar) const { return Vector3<T, SpaceTag>(x / scalar, y / scalar, z / scalar); }

    // Cannot mix different spaces - these operations are deleted
    template <typename OtherSpace> Vector3<T, SpaceTag> operator+(const Vector3<T, OtherSpace>&) const = delete;

    template <typename OtherSpace> Vector3<T, SpaceTag> operator-(const Vector3<T, OtherSpace>&) const = delete;

    bool operator==(const Vector3<T, SpaceTag>& other) const { return x == other.x && y == other.y && z == other.z; }

    // Dot product
    T dot(const Vector3<T, SpaceTag>& other) const { return x * other.x + y * other.y + z * other.z; }

    // Cross product
    Vector3<T, SpaceTag> cross(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(y * other.z - z * other.y, z * other.x - x * other.z, x * other.y - y * other.x);
    }

    // Length calculations
    T lengthSquared() const { return x * x + y * y + z * z; }

    T length() const { return std::sqrt(lengthSquared()); }

    bool isFinite() const { return std::isfinite(x) && std::isfinite(y) && std::isfinite(z); }

    // Normalization
    Vector3<T, SpaceTag> normalized() const {
        T len = length();
        if (len == 0)
            return *this;
        return *this / len;
    }

    void normalize() {
        T len = length();
        if (len == 0)
            return;
        x /= len;
        y /= len;
        z /= len;
    }

    // Linear interpolation
    static Vector3<T, SpaceTag> lerp(const Vector3<T, SpaceTag>& a, const Vector3<T, SpaceTag>& b, T t) {
        return Vector3<T, SpaceTag>(a.x + t * (b.x - a.x), a.y + t * (b.y - a.y), a.z + t * (b.z - a.z));
    }

    // Space conversion function
    template <typename TargetSpace> Vector3<T, TargetSpace> as() const { return Vector3<T, TargetSpace>(x, y, z); }
};

/**
 * @brief Quaternion class for representing rotations
 *
 * @tparam T Numeric type (float, double, etc.)
 */
template <typename T> class Quaternion {
  public:
    T x, y, z, w;

    Quaternion() : x(0), y(0), z(0), w(1) {}
    Quaternion(T x, T y, T z, T w) : x(x), y(y), z(z), w(w) {}

    // Create from axis angle
    static Quaternion<T> fromAxisAngle(const Vector3<T, Space::World>& axis, T angle) {
        T halfAngle = angle * T(0.5);
        T s = std::sin(halfAngle);

        return Quaternion<T>(axis.x * s, axis.y * s, axis.z * s, std::cos(halfAngle));
    }

    // Create from a row-major 3x3 rotation matrix (orthonormal, no scale)
    static Quaternion<T> fromRotationMatrix(T r00, T r01, T r02, T r10, T r11, T r12, T r20, T r21, T r22) {
        T trace = r00 + r11 + r22;
        if (trace > 0) {
            T s = T(0.5) / std::sqrt(trace + T(1));
            return Quaternion<T>((r21 - r12) * s, (r02 - r20) * s, (r10 - r01) * s, T(0.25) / s);
        } else if (r00 > r11 && r00 > r22) {
            T s = T(2) * std::sqrt(T(1) + r00 - r11 - r22);
            return Quaternion<T>(T(0.25) * s, (r01 + r10) / s, (r02 + r20) / s, (r21 - r12) / s);
        } else if (r11 > r22) {
            T s = T(2) * std::sqrt(T(1) + r11 - r00 - r22);
            return Quaternion<T>((r01 + r10) / s, T(0.25) * s, (r12 + r21) / s, (r02 - r20) / s);
        }
        T s = T(2) * std::sqrt(T(1) + r22 - r00 - r11);
        return Quaternion<T>((r02 + r20) / s, (r12 + r21) / s, T(0.25) * s, (r10 - r01) / s);
    }

    // Orientation whose local -Z axis points along `forward`.
    // `up` is a hint; a hint parallel to forward falls back to world Z.
    static Quaternion<T> lookRotation(const Vector3<T, Space::World>& forward, const Vector3<T, Space::World>& up) {
        using Vec3 = Vector3<T, Space::World>;
        Vec3 f = forward.normalized();
        if (f.lengthSquared() == 0)
            return Quaternion<T>();

        Vec3 hint = up.normalized();
        if (std::abs(f.dot(hint)) > T(0.999))
            hint = std::abs(f.z) < T(0.999) ? Vec3(0, 0, 1) : Vec3(1, 0, 0);

        Vec3 right = f.cross(hint).normalized();
        Vec3 trueUp = right.cross(f);
        Vec3 back = -f;

        // Columns are the world images of local X, Y, Z
        return fromRotationMatrix(right.x, trueUp.x, back.x, right.y, trueUp.y, back.y, right.z, trueUp.z, back.z)
            .normalized();
    }

    // Quaternion multiplication
    Quaternion<T> operator*(const Quaternion<T>& other) const {
        return Quaternion<T>(w * other.x + x * other.w + y * other.z - z * other.y,
                             w * other.y - x * other.z + y * other.w + z * other.x,
                             w * other.z + x * other.y - y * other.x + z * other.w,
                             w * other.w - x * other.x - y * other.y - z * other.z);
    }

    // Length operations
    T lengthSquared() const { return x * x + y * y + z * z + w * w; }

    T length() const { return std::sqrt(lengthSquared()); }

    // Normalization
    Quaternion<T> normalized() const {
        T len = length();
        if (len == 0)
            return *this;
        return Quaternion<T>(x / len, y / len, z / len, w / len);
    }

    // Conjugate
    Quaternion<T> conjugate() const { return Quaternion<T>(-x, -y, -z, w); }

    // Spherical linear interpolation
    static Quaternion<T> slerp(const Quaternion<T>& a, const Quaternion<T>& b, T t) {
        T dot = a.x * b.x + a.y * b.y + a.z * b.z + a.w * b.w;

        // Negate one quaternion to take shorter path
        Quaternion<T> b2 = b;
        if (dot < T(0)) {
            dot = -dot;
            b2 = Quaternion<T>(-b.x, -b.y, -b.z, -b.w);
        }

        // Fall back to normalized lerp when quaternions are very close
        if (dot > T(0.9995)) {
            return Quaternion<T>(a.x + t * (b2.x - a.x), a.y + t * (b2.y - a.y), a.z + t * (b2.z - a.z),
                                 a.w + t * (b2.w - a.w))
                .normalized();
        }

        T theta = std::acos(dot);
        T sinTheta = std::sin(theta);
        T wa = std::sin((T(1) - t) * theta) / sinTheta;
        T wb = std::sin(t * theta) / sinTheta;

        return Quaternion<T>(wa * a.x + wb * b2.x, wa * a.y + wb * b2.y, wa * a.z + wb * b2.z, wa * a.w + wb * b2.w);
    }

    // Rotate a vector by this quaternion
    template <typename SpaceTag> Vector3<T, SpaceTag> rotateVector(const Vector3<T, SpaceTag>& v) const {
        Quaternion<T> vQuat(v.x, v.y, v.z, 0);
        Quaternion<T> result = *this * vQuat * conjugate();
        return Vector3<T, SpaceTag>(result.x, result.y, result.z);
    }
};

/**
 * @brief 4x4 matrix class for transformations
 *
 * @tparam T Numeric type (float, double, etc.)
 */
template <typename T> class Matrix4x4 {
  public:
    // Matrix stored in column-major order (OpenGL style)
    std::array<T, 16> elements;

    // Constructor - identity matrix by default
    Matrix4x4() { setIdentity(); }

    explicit Matrix4x4(const std::array<T, 16>& data) : elements(data) {}

    void setIdentity() { elements = {1, 0, 0, 0, 0, 1, 0, 0, 0, 0, 1, 0, 0, 0, 0, 1}; }

    // Element access
    T& operator()(int row, int col) { return elements[col * 4 + row]; }

    const T& operator()(int row, int col) const { return elements[col * 4 + row]; }

    // Matrix multiplication
    Matrix4x4<T> operator*(const Matrix4x4<T>& other) const {
        Matrix4x4<T> result;

        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                result(i, j) = 0;
                for (int k = 0; k < 4; ++k) {
                    result(i, j) += (*this)(i, k) * other(k, j);
                }
            }
        }

        return result;
    }

    // Vector3 transformation with implicit w=1
    template <typename SpaceTag, typename ResultSpaceTag>
    Vector3<T, ResultSpaceTag> transformPoint(const Vector3<T, SpaceTag>& v) const {
        return Vector3<T, ResultSpaceTag>(elements[0] * v.x + elements[4] * v.y + elements[8] * v.z + elements[12],
                                          elements[1] * v.x + elements[5] * v.y + elements[9] * v.z + elements[13],
                                          elements[2] * v.x + elements[6] * v.y + elements[10] * v.z + elements[14]);
    }

    static Matrix4x4<T> translation(const Vector3<T, Space::World>& v) {
        Matrix4x4<T> result;
        result(0, 3) = v.x;
        result(1, 3) = v.y;
        result(2, 3) = v.z;
        return result;
    }

    static Matrix4x4<T> rotation(const Quaternion<T>& q) {
        T xx = q.x * q.x;
        T xy = q.x * q.y;
        T xz = q.x * q.z;
        T xw = q.x * q.w;
        T yy = q.y * q.y;
        T yz = q.y * q.z;
        T yw = q.y * q.w;
        T zz = q.z * q.z;
        T zw = q.z * q.w;

        Matrix4x4<T> result;
        result(0, 0) = 1 - 2 * (yy + zz);
        result(0, 1) = 2 * (xy - zw);
        result(0, 2) = 2 * (xz + yw);

        result(1, 0) = 2 * (xy + zw);
        result(1, 1) = 1 - 2 * (xx + zz);
        result(1, 2) = 2 * (yz - xw);

        result(2, 0) = 2 * (xz - yw);
        result(2, 1) = 2 * (yz + xw);
        result(2, 2) = 1 - 2 * (xx + yy);

        return result;
    }

    Matrix4x4<T> inverse() const {
        static_assert(std::is_same_v<T, float> || std::is_same_v<T, double>,
                      "Matrix4x4::inverse() only supported for float and double");

        if constexpr (std::is_same_v<T, float>) {
            glm::mat4 glmMat = glm::make_mat4(elements.data());
            float det = glm::determinant(glmMat);
            if (std::abs(det) < 1e-8f) {
                return Matrix4x4<T>();
            }
            glm::mat4 glmInv = glm::inverse(glmMat);
            Matrix4x4<T> result;
            std::copy(glm::value_ptr(glmInv), glm::value_ptr(glmInv) + 16, result.elements.begin());
            return result;
        } else {
            glm::dmat4 glmMat = glm::make_mat4(elements.data());
            double det = glm::determinant(glmMat);
            if (std::abs(det) < 1e-15) {
                return Matrix4x4<T>();
            }
            glm::dmat4 glmInv = glm::inverse(glmMat);
            Matrix4x4<T> result;
            std::copy(glm::value_ptr(glmInv), glm::value_ptr(glmInv) + 16, result.elements.begin());
            return result;
        }
    }
};

/**
 * @brief Rigid pose (position + rotation). Droplet size lives beside the
 * pose rather than in it, so the matrix never carries scale.
 *
 * @tparam T Numeric type (float, double, etc.)
 */
template <typename T> class Transform {
  public:
    using Vec3 = Vector3<T, Space::World>;
    using Quat = Quaternion<T>;
    using Mat4 = Matrix4x4<T>;

    Transform() : position_(Vec3(0, 0, 0)), rotation_(Quat()), dirty_(true) {}
    Transform(const Vec3& position, const Quat& rotation) : position_(position), rotation_(rotation), dirty_(true) {}

    // Rebuild a pose from a rigid matrix (rotation + translation only)
    static Transform<T> fromMatrix(const Mat4& m) {
        Transform<T> result;
        result.position_ = Vec3(m(0, 3), m(1, 3), m(2, 3));
        result.rotation_ =
            Quat::fromRotationMatrix(m(0, 0), m(0, 1), m(0, 2), m(1, 0), m(1, 1), m(1, 2), m(2, 0), m(2, 1), m(2, 2))
                .normalized();
        return result;
    }

    const Vec3& getPosition() const { return position_; }
    const Quat& getRotation() const { return rotation_; }

    void setPosition(const Vec3& position) {
        position_ = position;
        dirty_ = true;
    }

    void setRotation(const Quat& rotation) {
        rotation_ = rotation;
        dirty_ = true;
    }

    const Mat4& getMatrix() const {
        if (dirty_) {
            matrix_ = Mat4::translation(position_) * Mat4::rotation(rotation_);
            dirty_ = false;
        }
        return matrix_;
    }

    // Transform a point from local to world space
    template <typename SpaceTag> Vector3<T, Space::World> transformPoint(const Vector3<T, SpaceTag>& point) const {
        return getMatrix().template transformPoint<SpaceTag, Space::World>(point);
    }

    // Direction of the local axes in world space
    Vec3 upVector() const { return rotation_.rotateVector(Vec3(0, 1, 0)); }
    Vec3 lookVector() const { return rotation_.rotateVector(Vec3(0, 0, -1)); }

    Transform<T> inverse() const { return fromMatrix(getMatrix().inverse()); }

    // this * other: other is expressed relative to this
    Transform<T> operator*(const Transform<T>& other) const { return fromMatrix(getMatrix() * other.getMatrix()); }

  private:
    Vec3 position_;
    Quat rotation_;
    mutable Mat4 matrix_;
    mutable bool dirty_;
};

using Vec3f = Vector3<float, Space::World>;
using Quatf = Quaternion<float>;
using Transformf = Transform<float>;

} // namespace spill
