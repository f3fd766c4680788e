#include "NhiReaderApi.h"
#include "ccidreader.h"
#include "drivererror.h"
#include "nhiapplet.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>

using namespace nhireader;

namespace {

struct Session {
    std::mutex m;
    std::unique_ptr<CcidReader> reader;
    bool portOpen = false;   // held open between csOpenCom and csCloseCom
};

Session& session(){
    static Session s;
    return s;
}

void trace(const std::string& msg){
    static const bool on = std::getenv("NHIREADER_DEBUG") != nullptr;
    if (on) std::fprintf(stderr, "nhireader: %s\n", msg.c_str());
}

OpenParams openParams(){
    OpenParams p;
    if (const char* id = std::getenv("NHIREADER_USB_ID")){
        unsigned vid=0, pid=0;
        if (std::sscanf(id, "%x:%x", &vid, &pid)==2){ p.vid = uint16_t(vid); p.pid = uint16_t(pid); }
        else trace(std::string("ignoring malformed NHIREADER_USB_ID ") + id);
    }
    return p;
}

void ensureOpen(Session& s){
    if (!s.reader) s.reader = std::make_unique<CcidReader>();
    if (!s.reader->isOpen()){
        s.reader->open(openParams());
        trace("opened " + s.reader->describe());
    }
}

// Powers the card for one transaction and closes a port nobody asked to keep open.
class CardTransaction {
public:
    explicit CardTransaction(Session& s) : s_(s) {
        try {
            ensureOpen(s_);
            if (s_.reader->cardStatus()==CardPresence::NotPresent)
                throw DriverError(NHIREADER_ERR_NO_CARD, "No card in the reader");
            s_.reader->powerOn();
        } catch (...) {
            if (s_.reader && !s_.portOpen) s_.reader->close();
            throw;
        }
    }
    ~CardTransaction(){
        try {
            s_.reader->powerOff();
        } catch (const DriverError& ex) {
            trace(std::string("power off failed: ") + ex.what());
        }
        if (!s_.portOpen) s_.reader->close();
    }
    CardTransaction(const CardTransaction&) = delete;
    CardTransaction& operator=(const CardTransaction&) = delete;

    std::vector<uint8_t> basicData(){
        return readBasicData([this](const std::vector<uint8_t>& c){ return s_.reader->transmit(c); });
    }
private:
    Session& s_;
};

template <class Fn>
int guarded(const char* name, Fn&& fn){
    try {
        return fn();
    } catch (const DriverError& ex) {
        trace(std::string(name) + " failed (" + std::to_string(ex.code()) + "): " + ex.what());
        return ex.code();
    } catch (const std::exception& ex) {
        trace(std::string(name) + " failed: " + ex.what());
        return NHIREADER_ERR_NO_CARD;
    }
}

}

extern "C" {

NHIREADER_API int NHIREADER_CALL hisGetBasicData(char* buffer, int* length){
    if (!buffer || !length || *length < NHIREADER_BASIC_DATA_SIZE) return NHIREADER_ERR_ARGUMENT;
    Session& s = session();
    std::lock_guard<std::mutex> lk(s.m);
    return guarded("hisGetBasicData", [&]{
        std::vector<uint8_t> data;
        {
            CardTransaction tx(s);
            data = tx.basicData();
        }
        std::memcpy(buffer, data.data(), data.size());
        *length = int(data.size());
        trace("basic data read, " + std::to_string(data.size()) + " bytes");
        return NHIREADER_OK;
    });
}

NHIREADER_API int NHIREADER_CALL csOpenCom(int port){
    Session& s = session();
    std::lock_guard<std::mutex> lk(s.m);
    return guarded("csOpenCom", [&]{
        trace("csOpenCom(" + std::to_string(port) + "), USB reader ignores the port number");
        ensureOpen(s);
        s.portOpen = true;
        return NHIREADER_OK;
    });
}

NHIREADER_API int NHIREADER_CALL csCloseCom(void){
    Session& s = session();
    std::lock_guard<std::mutex> lk(s.m);
    s.portOpen = false;
    if (s.reader) s.reader->close();
    return NHIREADER_OK;
}

NHIREADER_API int NHIREADER_CALL csReadCard(char* buffer){
    if (!buffer) return NHIREADER_ERR_ARGUMENT;
    Session& s = session();
    std::lock_guard<std::mutex> lk(s.m);
    return guarded("csReadCard", [&]{
        std::vector<uint8_t> data;
        {
            CardTransaction tx(s);
            data = tx.basicData();
        }
        const std::string text = basicDataToText(data);
        std::memcpy(buffer, text.c_str(), text.size()+1);
        return NHIREADER_OK;
    });
}

NHIREADER_API const char* nhireader_version(void){
    return "nhireader 1.0";
}

}
