#include "include/TonCell.h"
#include "include/ByteCodec.h"

namespace Ton {

CellBuilder& CellBuilder::WriteBit(bool bit) {
    m_bits.push_back(bit);
    return *this;
}

CellBuilder& CellBuilder::WriteUint(uint64_t value, unsigned bits) {
    for (unsigned i = bits; i > 0; --i) {
        const unsigned shift = i - 1;
        m_bits.push_back(shift < 64 && ((value >> shift) & 1) != 0);
    }
    return *this;
}

CellBuilder& CellBuilder::WriteInt(int64_t value, unsigned bits) {
    uint64_t raw = static_cast<uint64_t>(value);
    if (bits < 64) {
        raw &= (uint64_t{1} << bits) - 1;
    }
    return WriteUint(raw, bits);
}

CellBuilder& CellBuilder::WriteBytes(const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        WriteUint(data[i], 8);
    }
    return *this;
}

CellBuilder& CellBuilder::WriteBytes(const std::vector<uint8_t>& data) {
    return WriteBytes(data.data(), data.size());
}

CellBuilder& CellBuilder::WriteCoins(const std::vector<uint8_t>& amount) {
    size_t first = 0;
    while (first < amount.size() && amount[first] == 0) {
        ++first;
    }
    const size_t length = amount.size() - first;
    WriteUint(length, 4);
    return WriteBytes(amount.data() + first, length);
}

bool CellBuilder::WriteCoins(const std::string& decimal) {
    std::vector<uint8_t> amount;
    if (!Codec::DecimalToBytes(decimal, amount) || amount.size() > 15) {
        return false;
    }
    WriteCoins(amount);
    return true;
}

CellBuilder& CellBuilder::WriteAddressNone() {
    return WriteUint(0, 2);
}

CellBuilder& CellBuilder::WriteAddress(const Address& address) {
    WriteUint(0b10, 2);
    WriteBit(false);
    WriteInt(address.workchain, 8);
    return WriteBytes(address.hash.data(), address.hash.size());
}

CellBuilder& CellBuilder::WriteRef(const CellBuilder& child) {
    m_refs.push_back(std::make_shared<const CellBuilder>(child));
    return *this;
}

std::vector<uint8_t> CellBuilder::Build() const {
    const size_t bitLength = m_bits.size();
    std::vector<uint8_t> data((bitLength + 7) / 8, 0);

    for (size_t i = 0; i < bitLength; ++i) {
        if (m_bits[i]) {
            data[i / 8] |= static_cast<uint8_t>(1u << (7 - (i % 8)));
        }
    }

    // completion tag
    if (bitLength % 8 != 0) {
        data.back() |= static_cast<uint8_t>(1u << (7 - (bitLength % 8)));
    }

    return data;
}

} // namespace Ton
