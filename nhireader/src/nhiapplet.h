#ifndef NHIAPPLET_H
#define NHIAPPLET_H
#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace nhireader {

using Transmit = std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>;

struct ApduResponse {
    std::vector<uint8_t> data;
    uint16_t sw = 0;
};

// Field layout of the basic-data file on the card.
struct BasicDataFields {
    static constexpr size_t kCardNo = 0,  kCardNoLen = 12;
    static constexpr size_t kName = 12,   kNameLen = 20;
    static constexpr size_t kId = 32,     kIdLen = 10;
    static constexpr size_t kBirth = 42,  kBirthLen = 7;
    static constexpr size_t kSex = 49,    kSexLen = 1;
    static constexpr size_t kIssue = 50,  kIssueLen = 7;
    static constexpr size_t kDataLen = 57;
};

// Sends one APDU, following 61xx with GET RESPONSE and re-sending on 6Cxx.
ApduResponse exchange(const Transmit& tx, const std::vector<uint8_t>& capdu);

// Selects the NHI applet and reads the basic-data file, padded to the 72-byte vendor buffer.
// Throws DriverError.
std::vector<uint8_t> readBasicData(const Transmit& tx);

// "ID|NAME|BIRTH|SEX|CARDNO" with the name left in the card's Big5 bytes.
std::string basicDataToText(const std::vector<uint8_t>& basic);

} // namespace nhireader
#endif // NHIAPPLET_H
