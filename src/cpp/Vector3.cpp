#include "Vector3.h"

Vector3::Vector3(double x, double y, double z) : x(x), y(y), z(z) {
}

Vector3 Vector3::operator+(const Vector3& other) const {
    return Vector3(x + other.x, y + other.y, z + other.z);
}

Vector3 Vector3::operator-(const Vector3& other) const {
    return Vector3(x - other.x, y - other.y, z - other.z);
}

Vector3 Vector3::operator-() const {
    return Vector3(-x, -y, -z);
}

// Scale every axis, e.g. m/s^2 to g
Vector3 Vector3::operator*(double scalar) const {
    return Vector3(x * scalar, y * scalar, z * scalar);
}

Vector3 Vector3::operator/(double scalar) const {
    if (scalar == 0.0) {
        return Vector3(0, 0, 0);
    }
    return Vector3(x / scalar, y / scalar, z / scalar);
}

double Vector3::dot(const Vector3& other) const {
    return x * other.x + y * other.y + z * other.z;
}

Vector3 Vector3::cross(const Vector3& other) const {
    return Vector3(
        y * other.z - z * other.y,
        z * other.x - x * other.z,
        x * other.y - y * other.x
    );
}

double Vector3::magnitude() const {
    return std::sqrt(x * x + y * y + z * z);
}

// Unit vector; a zero vector stays zero
Vector3 Vector3::normalized() const {
    double mag = magnitude();
    if (mag == 0) {
        return Vector3(0, 0, 0);
    }
    return Vector3(x / mag, y / mag, z / mag);
}

Vector3 Vector3::rotatedAboutZ(double angle_radians) const {
    double c = std::cos(angle_radians);
    double s = std::sin(angle_radians);
    return Vector3(c * x + s * y, -s * x + c * y, z);
}
