#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Ton {

/**
 * @brief Standard TON account address (workchain + 256-bit account id)
 */
struct Address {
    int8_t workchain;
    std::array<uint8_t, 32> hash;
    bool bounceable;

    Address() : workchain(0), hash{}, bounceable(true) {}
};

/**
 * @brief Bit-level builder for TON cells
 *
 * Bits are appended most significant first. References are kept alongside
 * the data but Build() only serializes this cell's own bits, which is all
 * the wallet v3 external message needs.
 */
class CellBuilder {
public:
    CellBuilder() = default;

    CellBuilder& WriteBit(bool bit);

    /**
     * @brief Append the low `bits` bits of value, MSB first
     */
    CellBuilder& WriteUint(uint64_t value, unsigned bits);

    /**
     * @brief Append a signed value in two's complement (masked to `bits`)
     */
    CellBuilder& WriteInt(int64_t value, unsigned bits);

    /**
     * @brief Append whole bytes
     */
    CellBuilder& WriteBytes(const uint8_t* data, size_t len);
    CellBuilder& WriteBytes(const std::vector<uint8_t>& data);

    /**
     * @brief Append a Grams amount: 4-bit byte count followed by the bytes
     * @param amount Minimal big-endian value (empty for zero)
     */
    CellBuilder& WriteCoins(const std::vector<uint8_t>& amount);

    /**
     * @brief Append a Grams amount given as a base-10 string
     * @return false if the amount is not a decimal number or needs more than 15 bytes
     */
    bool WriteCoins(const std::string& decimal);

    /**
     * @brief Append addr_none (two zero bits)
     */
    CellBuilder& WriteAddressNone();

    /**
     * @brief Append addr_std: tag 10, no anycast, int8 workchain, 256-bit hash
     */
    CellBuilder& WriteAddress(const Address& address);

    /**
     * @brief Attach a child cell
     */
    CellBuilder& WriteRef(const CellBuilder& child);

    /**
     * @brief Pack the data bits into bytes, setting the completion tag when
     *        the bit length is not a multiple of eight
     */
    std::vector<uint8_t> Build() const;

    size_t BitLength() const { return m_bits.size(); }
    size_t RefCount() const { return m_refs.size(); }

private:
    std::vector<bool> m_bits;
    std::vector<std::shared_ptr<const CellBuilder>> m_refs;
};

} // namespace Ton
