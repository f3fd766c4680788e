#ifndef CCIDREADER_H
#define CCIDREADER_H

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <libusb-1.0/libusb.h>

namespace nhireader {

struct OpenParams {
    uint16_t vid = 0x072F;
    uint16_t pid = 0x9000;
    bool detachKernelDriver = true;
    unsigned ioTimeoutMs = 3000;
};

enum class CardPresence { NotPresent, PresentInactive, PresentActive, Unknown };

// USB smart card reader speaking either CCID or the legacy ACS bulk protocol.
class CcidReader final {
public:
    CcidReader();
    ~CcidReader();

    CcidReader(const CcidReader&) = delete;
    CcidReader& operator=(const CcidReader&) = delete;

    void open(const OpenParams& params);
    void close();
    bool isOpen() const { return h_ != nullptr; }
    std::string describe() const;

    CardPresence cardStatus();
    std::vector<uint8_t> powerOn();
    void powerOff();
    std::vector<uint8_t> transmit(const std::vector<uint8_t>& capdu);

private:
    libusb_context* ctx_ = nullptr;
    libusb_device_handle* h_ = nullptr;
    int ifNum_ = -1;
    uint8_t epBulkIn_ = 0, epBulkOut_ = 0;
    uint16_t vid_ = 0, pid_ = 0;

    enum class Backend { CCID, ACS } backend_ = Backend::CCID;

    unsigned ioTimeoutMs_ = 3000;
    uint8_t ccidSeq_ = 1;

    void findAndClaim(const OpenParams& p);
    void requireOpen() const;

    std::vector<uint8_t> ccidSend(uint8_t msgType, const std::vector<uint8_t>& data);
    std::vector<uint8_t> acsSend(uint8_t ins, const std::vector<uint8_t>& data);
    std::vector<uint8_t> bulkExchange(const std::vector<uint8_t>& out, size_t headerSize,
                                      size_t (*payloadLength)(const std::vector<uint8_t>&));

    static std::string libusbErr(int r);
};

} // namespace nhireader

#endif // CCIDREADER_H
