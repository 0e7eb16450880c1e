#include "Quaternion.h"

#include <algorithm>

Quaternion::Quaternion(double w, double x, double y, double z) : w(w), x(x), y(y), z(z) {}

Quaternion::Quaternion(const Vector3& axis, double angle_radians) {
	Vector3 normalized_axis = axis.normalized();
	double half_angle = angle_radians * 0.5;

	w = std::cos(half_angle);
	x = std::sin(half_angle) * normalized_axis.getX();
	y = std::sin(half_angle) * normalized_axis.getY();
	z = std::sin(half_angle) * normalized_axis.getZ();
}

Quaternion Quaternion::fromEuler(const EulerAngles& angles) {
	double cr = std::cos(angles.roll * 0.5), sr = std::sin(angles.roll * 0.5);
	double cp = std::cos(angles.pitch * 0.5), sp = std::sin(angles.pitch * 0.5);
	double cy = std::cos(angles.yaw * 0.5), sy = std::sin(angles.yaw * 0.5);

	return Quaternion(
		cr * cp * cy + sr * sp * sy,
		sr * cp * cy - cr * sp * sy,
		cr * sp * cy + sr * cp * sy,
		cr * cp * sy - sr * sp * cy
	);
}

//Hamilton product
Quaternion Quaternion::operator*(const Quaternion& other) const {
	return Quaternion(
		w * other.getW() - x * other.getX() - y * other.getY() - z * other.getZ(),
		w * other.getX() + x * other.getW() + y * other.getZ() - z * other.getY(),
		w * other.getY() - x * other.getZ() + y * other.getW() + z * other.getX(),
		w * other.getZ() + x * other.getY() - y * other.getX() + z * other.getW()
	);
}

Quaternion Quaternion::conjugate() const {
	return Quaternion(w, -x, -y, -z);
}

double Quaternion::dot(const Quaternion& other) const {
	return w * other.w + x * other.x + y * other.y + z * other.z;
}

double Quaternion::norm() const {
	return std::sqrt(w*w + x*x + y*y + z*z);
}

Quaternion Quaternion::normalized() const {
	double n = norm();
	if (n == 0) {
		return Quaternion(1, 0, 0, 0);
	}
	return Quaternion(w/n, x/n, y/n, z/n);
}

//v' = q * v * q^-1
Vector3 Quaternion::rotate(const Vector3& v) const {
	Quaternion vec_quat(0, v.getX(), v.getY(), v.getZ());
	Quaternion result = (*this) * vec_quat * this->conjugate();
	return Vector3(result.x, result.y, result.z);
}

EulerAngles Quaternion::toEuler() const {
	EulerAngles angles;
	angles.roll = std::atan2(2.0 * (w * x + y * z), 1.0 - 2.0 * (x * x + y * y));
	double sin_pitch = std::clamp(2.0 * (w * y - z * x), -1.0, 1.0); //gimbal lock guard
	angles.pitch = std::asin(sin_pitch);
	angles.yaw = std::atan2(2.0 * (w * z + x * y), 1.0 - 2.0 * (y * y + z * z));
	return angles;
}

Quaternion Quaternion::integrated(const Vector3& body_rate, double dt) const {
	double rate = body_rate.magnitude();
	if (rate == 0.0 || dt <= 0.0) {
		return *this;
	}
	Quaternion delta(body_rate, rate * dt);
	return ((*this) * delta).normalized();
}

Quaternion Quaternion::blendedToward(const Quaternion& target, double weight) const {
	//q and -q are the same attitude
	Quaternion t = dot(target) < 0.0 ? Quaternion(-target.w, -target.x, -target.y, -target.z) : target;
	double keep = 1.0 - weight;
	return Quaternion(
		keep * w + weight * t.w,
		keep * x + weight * t.x,
		keep * y + weight * t.y,
		keep * z + weight * t.z
	).normalized();
}
