#include "binary_writer.hxx"

namespace oishii {

Writer::Writer(std::endian endian) : m_endian(endian) {}
Writer::Writer(std::vector<u8>&& buf, std::endian endian)
    : VectorStream(std::move(buf)), m_endian(endian) {}

} // namespace oishii
