#pragma once
#include <ArduinoJson.h>
#include <cstdint>
#include <string>
#include "datapoints.h"

namespace cozyhub {

// Command kinds carried in the "cmd" field
enum class Command : uint8_t {
    INFO  = 0,
    QUERY = 2,
    SET   = 3
};

static const int PROTOCOL_VERSION = 0;

// Every TCP frame is one JSON object followed by CRLF
static const char FRAME_DELIMITER[] = "\r\n";

bool isValidCommand(int cmd);
const char* commandToString(int cmd);

// Sequence tokens: epoch milliseconds as a decimal string, bumped when two
// requests fall in the same millisecond so every token is strictly greater
// than the previous one. Not thread-safe; owners serialize access.
class SequenceGenerator {
public:
    SequenceGenerator() : _last(0) {}
    std::string next();

private:
    uint64_t _last;
};

// Build a request object {cmd, pv, sn, msg} inside doc.
// payload is only used for SET (attr = its keys, data = the map).
// Returns false for a command kind outside {INFO, QUERY, SET}.
bool buildRequest(JsonDocument& doc, int cmd, const std::string& sn,
                  const DatapointMap& payload);

// Build and serialize a request, CRLF-terminated, into out
bool encodeRequest(int cmd, const std::string& sn, const DatapointMap& payload,
                   std::string& out);

// Parse one received frame; trailing CR/LF are ignored.
// Returns false unless the frame is a JSON object.
bool decodeFrame(const char* data, size_t len, JsonDocument& doc);

// True if the response echoes the request's sequence token exactly
bool responseMatches(const JsonDocument& response, const std::string& sn);

// INFO reply fields ("msg" of a cmd=0 response)
struct InfoReply {
    std::string did;
    std::string dtp;
    std::string pid;
    std::string mac;
    std::string ip;
    std::string sv;
    std::string hv;
    int rssi;
    bool hasRssi;
};

// Parse INFO msg fields. sv defaults to "Unknown".
// Returns false if did or pid is missing; the other fields are still filled.
bool parseInfoReply(JsonObjectConst msg, InfoReply& info);

// Extract {"data": {"<dpId>": value}} from a QUERY reply msg.
// Entries with non-numeric keys, non-integer values or values outside a
// known datapoint range are skipped and counted in dropped.
// Returns false if msg has no data object.
bool parseQueryData(JsonObjectConst msg, DatapointMap& out, int& dropped);

} // namespace cozyhub
