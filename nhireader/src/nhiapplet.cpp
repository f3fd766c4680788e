#include "nhiapplet.h"
#include "drivererror.h"
#include "NhiReaderApi.h"
#include <algorithm>
#include <cstdio>

namespace nhireader {
namespace {

const std::vector<uint8_t> kSelectApplet = {
    0x00, 0xA4, 0x04, 0x00, 0x10,
    0xD1, 0x58, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x11, 0x00
};
const std::vector<uint8_t> kReadBasicData = { 0x00, 0xCA, 0x11, 0x00, 0x02, 0x00, 0x00 };

std::string swText(uint16_t sw){
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04X", sw);
    return buf;
}

std::string field(const std::vector<uint8_t>& b, size_t off, size_t len){
    std::string s(b.begin()+off, b.begin()+off+len);
    const auto end = s.find_last_not_of(std::string(" \0", 2));
    s.erase(end==std::string::npos ? 0 : end+1);
    const auto nul = s.find('\0');
    if (nul!=std::string::npos) s.erase(nul);
    return s;
}

}

ApduResponse exchange(const Transmit& tx, const std::vector<uint8_t>& capdu){
    std::vector<uint8_t> cmd = capdu;
    ApduResponse out;
    for (int round=0; round<16; ++round){
        std::vector<uint8_t> r = tx(cmd);
        if (r.size()<2) throw DriverError(NHIREADER_ERR_NO_CARD, "Card response shorter than a status word");
        const uint8_t sw1 = r[r.size()-2], sw2 = r[r.size()-1];
        out.data.insert(out.data.end(), r.begin(), r.end()-2);
        if (sw1==0x61){
            cmd = {0x00, 0xC0, 0x00, 0x00, sw2};
            continue;
        }
        if (sw1==0x6C && !capdu.empty()){
            cmd = capdu;
            cmd.back() = sw2;
            out.data.clear();
            continue;
        }
        out.sw = uint16_t((sw1<<8) | sw2);
        return out;
    }
    throw DriverError(NHIREADER_ERR_TIMEOUT, "Card kept asking for GET RESPONSE");
}

std::vector<uint8_t> readBasicData(const Transmit& tx){
    const ApduResponse sel = exchange(tx, kSelectApplet);
    if (sel.sw!=0x9000) throw DriverError(NHIREADER_ERR_NOT_NHI, "Select NHI applet returned SW " + swText(sel.sw));

    ApduResponse rd = exchange(tx, kReadBasicData);
    if (rd.sw!=0x9000) throw DriverError(NHIREADER_ERR_NO_CARD, "Read basic data returned SW " + swText(rd.sw));
    if (rd.data.size()<BasicDataFields::kDataLen)
        throw DriverError(NHIREADER_ERR_NO_CARD, "Basic data too short: " + std::to_string(rd.data.size()) + " bytes");

    std::vector<uint8_t> out(NHIREADER_BASIC_DATA_SIZE, 0);
    std::copy(rd.data.begin(), rd.data.begin()+BasicDataFields::kDataLen, out.begin());
    return out;
}

std::string basicDataToText(const std::vector<uint8_t>& b){
    using F = BasicDataFields;
    if (b.size()<F::kDataLen) throw DriverError(NHIREADER_ERR_NO_CARD, "Basic data too short");
    return field(b, F::kId, F::kIdLen) + '|' + field(b, F::kName, F::kNameLen) + '|'
         + field(b, F::kBirth, F::kBirthLen) + '|' + field(b, F::kSex, F::kSexLen) + '|'
         + field(b, F::kCardNo, F::kCardNoLen);
}

} // namespace nhireader
