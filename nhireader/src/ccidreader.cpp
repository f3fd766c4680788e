#include "ccidreader.h"
#include "drivererror.h"
#include "NhiReaderApi.h"
#include <cstring>
#include <iomanip>
#include <sstream>

namespace nhireader {
namespace {
constexpr uint8_t USB_CLASS_CCID = 0x0B;

constexpr uint8_t PC_to_RDR_IccPowerOn    = 0x62;
constexpr uint8_t PC_to_RDR_IccPowerOff   = 0x63;
constexpr uint8_t PC_to_RDR_GetSlotStatus = 0x65;
constexpr uint8_t PC_to_RDR_XfrBlock      = 0x6F;

constexpr uint8_t ACS_HDR           = 0x01;
constexpr uint8_t ACS_GET_ACR_STAT  = 0x01;
constexpr uint8_t ACS_RESET_DEFAULT = 0x80;
constexpr uint8_t ACS_POWER_OFF     = 0x81;
constexpr uint8_t ACS_EXCHANGE_T0   = 0xA0;

constexpr size_t CCID_HEADER = 10;
constexpr size_t ACS_HEADER = 4;

uint32_t le32(const uint8_t* p){
    return (uint32_t)p[0] | ((uint32_t)p[1]<<8) | ((uint32_t)p[2]<<16) | ((uint32_t)p[3]<<24);
}

size_t ccidPayload(const std::vector<uint8_t>& hdr){ return le32(&hdr[1]); }
size_t acsPayload(const std::vector<uint8_t>& hdr){ return (size_t(hdr[2])<<8) | hdr[3]; }

int transferCode(int r){
    return r==LIBUSB_ERROR_TIMEOUT ? NHIREADER_ERR_TIMEOUT : NHIREADER_ERR_NO_CARD;
}

}

std::string CcidReader::libusbErr(int r){
    std::ostringstream os; os<<"libusb("<<r<<"): "<<libusb_error_name(r);
    return os.str();
}

CcidReader::CcidReader() {
    if (int r = libusb_init(&ctx_); r != 0) throw DriverError(NHIREADER_ERR_PORT, libusbErr(r));
    libusb_set_option(ctx_, LIBUSB_OPTION_LOG_LEVEL, LIBUSB_LOG_LEVEL_NONE);
}

CcidReader::~CcidReader() {
    close();
    if (ctx_) libusb_exit(ctx_);
}

void CcidReader::open(const OpenParams& p){
    if (h_) close();
    ioTimeoutMs_ = p.ioTimeoutMs;
    findAndClaim(p);
}

void CcidReader::close(){
    if (h_ && ifNum_>=0) libusb_release_interface(h_, ifNum_);
    if (h_) { libusb_close(h_); h_ = nullptr; }
    ifNum_ = -1; epBulkIn_ = epBulkOut_ = 0;
}

std::string CcidReader::describe() const {
    std::ostringstream os;
    os << std::hex << std::setfill('0') << std::setw(4) << vid_ << ':' << std::setw(4) << pid_
       << std::dec << " if=" << ifNum_ << ' ' << (backend_==Backend::CCID ? "CCID" : "ACS");
    return os.str();
}

void CcidReader::requireOpen() const {
    if (!h_) throw DriverError(NHIREADER_ERR_PORT, "Reader is not open");
}

void CcidReader::findAndClaim(const OpenParams& p){
    libusb_device** list = nullptr;
    ssize_t n = libusb_get_device_list(ctx_, &list);
    if (n < 0) throw DriverError(NHIREADER_ERR_PORT, "libusb_get_device_list failed: " + libusbErr((int)n));

    libusb_device* chosen = nullptr;
    for (ssize_t i=0;i<n && !chosen;++i){
        libusb_device* d = list[i];
        libusb_device_descriptor t{};
        if (libusb_get_device_descriptor(d,&t)!=0 || t.idVendor!=p.vid || t.idProduct!=p.pid) continue;

        libusb_config_descriptor* cfg = nullptr;
        if (libusb_get_active_config_descriptor(d, &cfg)!=0 && libusb_get_config_descriptor(d, 0, &cfg)!=0)
            continue;
        for (uint8_t ii=0; ii<cfg->bNumInterfaces && !chosen; ++ii){
            const auto& alt = cfg->interface[ii];
            for (int a=0;a<alt.num_altsetting && !chosen;++a){
                const auto* ifd = &alt.altsetting[a];
                uint8_t in=0, out=0;
                for (uint8_t e=0;e<ifd->bNumEndpoints;++e){
                    const auto& ep = ifd->endpoint[e];
                    const uint8_t addr = ep.bEndpointAddress;
                    const uint8_t type = ep.bmAttributes & 0x03;
                    const bool dirIn = (addr & 0x80)!=0;
                    if (type==LIBUSB_TRANSFER_TYPE_BULK && dirIn)  in = addr;
                    if (type==LIBUSB_TRANSFER_TYPE_BULK && !dirIn) out = addr;
                }
                if (in && out){
                    epBulkIn_ = in; epBulkOut_ = out;
                    ifNum_ = ifd->bInterfaceNumber;
                    backend_ = (ifd->bInterfaceClass == USB_CLASS_CCID) ? Backend::CCID : Backend::ACS;
                    chosen = d;
                }
            }
        }
        libusb_free_config_descriptor(cfg);
    }

    int r = chosen ? libusb_open(chosen, &h_) : LIBUSB_ERROR_NOT_FOUND;
    libusb_free_device_list(list, 1);
    if (!chosen){
        std::ostringstream os;
        os << "No reader " << std::hex << std::setfill('0') << std::setw(4) << p.vid << ':' << std::setw(4) << p.pid
           << " with a bulk IN/OUT interface";
        throw DriverError(NHIREADER_ERR_PORT, os.str());
    }
    if (r != 0){ h_ = nullptr; throw DriverError(NHIREADER_ERR_PORT, "libusb_open failed: " + libusbErr(r)); }

    if (p.detachKernelDriver && libusb_kernel_driver_active(h_, ifNum_)==1)
        libusb_detach_kernel_driver(h_, ifNum_);
    if (r = libusb_claim_interface(h_, ifNum_); r != 0){
        libusb_close(h_); h_ = nullptr;
        throw DriverError(NHIREADER_ERR_PORT, "Cannot claim reader interface: " + libusbErr(r));
    }
    vid_ = p.vid; pid_ = p.pid;
}

std::vector<uint8_t> CcidReader::bulkExchange(const std::vector<uint8_t>& out, size_t headerSize,
                                              size_t (*payloadLength)(const std::vector<uint8_t>&)){
    std::vector<uint8_t> req = out;
    int tr=0;
    int r = libusb_bulk_transfer(h_, epBulkOut_, req.data(), (int)req.size(), &tr, (int)ioTimeoutMs_);
    if (r!=0 || tr!=(int)req.size()) throw DriverError(transferCode(r), "Bulk OUT failed: " + libusbErr(r));

    std::vector<uint8_t> buf; buf.reserve(512);
    auto readChunk = [&]()->int{
        uint8_t tmp[512]; int got=0;
        int rr = libusb_bulk_transfer(h_, epBulkIn_, tmp, (int)sizeof(tmp), &got, (int)ioTimeoutMs_);
        if (rr==LIBUSB_ERROR_TIMEOUT) return 0;
        if (rr!=0) throw DriverError(transferCode(rr), "Bulk IN failed: " + libusbErr(rr));
        buf.insert(buf.end(), tmp, tmp+got);
        return got;
    };
    for (int i=0; i<5 && buf.size()<headerSize; ++i) readChunk();
    if (buf.size()<headerSize) throw DriverError(NHIREADER_ERR_TIMEOUT, "Reader response header missing");
    const size_t need = headerSize + payloadLength(buf);
    while (buf.size()<need) {
        if (readChunk()==0) break;
    }
    if (buf.size()<need) throw DriverError(NHIREADER_ERR_TIMEOUT, "Reader response incomplete");
    buf.resize(need);
    return buf;
}

std::vector<uint8_t> CcidReader::ccidSend(uint8_t msgType, const std::vector<uint8_t>& data){
    std::vector<uint8_t> out(CCID_HEADER + data.size(), 0);
    const uint32_t L = (uint32_t)data.size();
    out[0] = msgType;
    out[1] = (uint8_t)(L & 0xFF);
    out[2] = (uint8_t)((L>>8)&0xFF);
    out[3] = (uint8_t)((L>>16)&0xFF);
    out[4] = (uint8_t)((L>>24)&0xFF);
    out[6] = ccidSeq_++;
    if (!data.empty()) std::memcpy(out.data()+CCID_HEADER, data.data(), data.size());
    return bulkExchange(out, CCID_HEADER, ccidPayload);
}

std::vector<uint8_t> CcidReader::acsSend(uint8_t ins, const std::vector<uint8_t>& data){
    const uint16_t N = (uint16_t)data.size();
    std::vector<uint8_t> out; out.reserve(ACS_HEADER+N);
    out.push_back(ACS_HDR);
    out.push_back(ins);
    out.push_back(uint8_t((N>>8)&0xFF));
    out.push_back(uint8_t(N & 0xFF));
    out.insert(out.end(), data.begin(), data.end());
    auto r = bulkExchange(out, ACS_HEADER, acsPayload);
    if (r[0]!=ACS_HDR) throw DriverError(NHIREADER_ERR_NO_CARD, "ACS: unexpected response header");
    return r;
}

CardPresence CcidReader::cardStatus(){
    requireOpen();
    if (backend_ == Backend::CCID){
        auto r = ccidSend(PC_to_RDR_GetSlotStatus, {});
        switch (r[7] & 0x03){
        case 0: return CardPresence::PresentActive;
        case 1: return CardPresence::PresentInactive;
        case 2: return CardPresence::NotPresent;
        default: return CardPresence::Unknown;
        }
    }
    auto r = acsSend(ACS_GET_ACR_STAT, {});
    if (r.size()<=ACS_HEADER) throw DriverError(NHIREADER_ERR_NO_CARD, "ACS: short status response");
    switch (r.back()){
    case 0x00: return CardPresence::NotPresent;
    case 0x01: return CardPresence::PresentInactive;
    case 0x03: return CardPresence::PresentActive;
    default: return CardPresence::Unknown;
    }
}

std::vector<uint8_t> CcidReader::powerOn(){
    requireOpen();
    if (backend_ == Backend::CCID){
        auto r = ccidSend(PC_to_RDR_IccPowerOn, {});
        if ((r[7] & 0xC0) != 0) throw DriverError(NHIREADER_ERR_NO_CARD, "Card power on failed");
        return std::vector<uint8_t>(r.begin()+CCID_HEADER, r.end());
    }
    auto r = acsSend(ACS_RESET_DEFAULT, {});
    if (r[1]!=0x00) throw DriverError(NHIREADER_ERR_NO_CARD, "ACS: card reset failed");
    return std::vector<uint8_t>(r.begin()+ACS_HEADER, r.end());
}

void CcidReader::powerOff(){
    requireOpen();
    if (backend_ == Backend::CCID){
        (void)ccidSend(PC_to_RDR_IccPowerOff, {});
        return;
    }
    auto r = acsSend(ACS_POWER_OFF, {});
    if (r[1]!=0x00) throw DriverError(NHIREADER_ERR_NO_CARD, "ACS: card power off failed");
}

std::vector<uint8_t> CcidReader::transmit(const std::vector<uint8_t>& capdu){
    requireOpen();
    if (backend_ == Backend::CCID){
        auto r = ccidSend(PC_to_RDR_XfrBlock, capdu);
        if ((r[7] & 0xC0) != 0) throw DriverError(NHIREADER_ERR_NO_CARD, "CCID: XfrBlock failed");
        return std::vector<uint8_t>(r.begin()+CCID_HEADER, r.end());
    }
    auto r = acsSend(ACS_EXCHANGE_T0, capdu);
    if (r[1]!=0x00) throw DriverError(NHIREADER_ERR_NO_CARD, "ACS: T=0 exchange failed");
    return std::vector<uint8_t>(r.begin()+ACS_HEADER, r.end());
}

} // namespace nhireader
