/**
 * @file VolumeGrid.cpp
 * @brief Explicit instantiations of VolumeGrid
 */

#include <VolSeg/Core/VolumeGrid.h>

namespace Vol::Seg {

template class VolumeGrid<uint8_t>;
template class VolumeGrid<int16_t>;
template class VolumeGrid<uint16_t>;
template class VolumeGrid<int32_t>;
template class VolumeGrid<float>;
template class VolumeGrid<double>;

} // namespace Vol::Seg
