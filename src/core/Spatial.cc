#include "spill/core/Spatial.hh"

namespace spill {

// Template instantiations for the float types droplets use
template class Vector3<float, Space::World>;
template class Vector3<float, Space::Local>;
template class Quaternion<float>;
template class Matrix4x4<float>;
template class Transform<float>;

} // namespace spill
