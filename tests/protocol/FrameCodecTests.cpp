#include <hostlink/protocol/Endian.hpp>
#include <hostlink/protocol/Errors.hpp>
#include <hostlink/protocol/FrameCodec.hpp>

#include <iostream>
#include <span>
#include <string>

using namespace hostlink::protocol;

namespace {

std::span<const std::uint8_t> jsonPart(const Bytes &frame) {
    return std::span<const std::uint8_t>(frame).subspan(kLengthPrefixSize);
}

Header sampleHeader() {
    return Header{
        {"byteorder", std::string(nativeByteOrder())},
        {"content-encoding", "utf-8"},
        {"content-protocol", "FileTransfer"},
        {"content-size", 10000},
        {"file-name", "report \xED\x95\x9C.bin"}, // 비 ASCII 이름
        {"file-size", 10000},
        {"nested", {{"a", 1}, {"b", {true, nullptr, 2.5}}}},
    };
}

bool test_round_trip_with_extras() {
    const Header h = sampleHeader();
    const Bytes frame = encodeHeader(h);

    const std::uint16_t len = loadU16Be(frame.data());
    if (len != frame.size() - kLengthPrefixSize) {
        std::cerr << "[roundtrip] length prefix " << len << " != json size "
                  << frame.size() - kLengthPrefixSize << "\n";
        return false;
    }

    const Header back = decodeHeader(jsonPart(frame));
    if (back != h) {
        std::cerr << "[roundtrip] decoded header differs: " << back.dump() << "\n";
        return false;
    }
    return true;
}

bool test_injects_byteorder_and_default_encoding() {
    const Header h = {{"content-protocol", "HostIdentity"}, {"content-size", 0}};
    const Header back = decodeHeader(jsonPart(encodeHeader(h)));

    if (back.value("byteorder", "") != nativeByteOrder()) {
        std::cerr << "[inject] byteorder missing or wrong\n";
        return false;
    }
    if (back.value("content-encoding", "") != "utf-8") {
        std::cerr << "[inject] default content-encoding missing\n";
        return false;
    }
    if (!missingHeaderFields(back).empty()) {
        std::cerr << "[inject] required fields still missing\n";
        return false;
    }

    // 명시한 인코딩은 유지된다.
    Header explicitEnc = h;
    explicitEnc["content-encoding"] = "UTF8";
    if (decodeHeader(jsonPart(encodeHeader(explicitEnc)))["content-encoding"] != "UTF8") {
        std::cerr << "[inject] explicit encoding overwritten\n";
        return false;
    }
    return true;
}

bool test_encoding_errors() {
    bool ok = true;

    try {
        (void)encodeHeader(Header::array({1, 2}));
        std::cerr << "[encode] array header accepted\n";
        ok = false;
    } catch (const EncodingError &) {
    }

    try {
        (void)encodeHeader(Header{{"file-name", std::string("\xFF\xFE")}});
        std::cerr << "[encode] invalid UTF-8 accepted\n";
        ok = false;
    } catch (const EncodingError &e) {
        if (e.kind() != ErrorKind::Encoding) {
            std::cerr << "[encode] wrong kind\n";
            ok = false;
        }
    }

    try {
        (void)encodeHeader(Header{{"content-encoding", "latin-1"}});
        std::cerr << "[encode] latin-1 accepted\n";
        ok = false;
    } catch (const EncodingError &) {
    }

    try {
        (void)encodeHeader(Header{{"blob", std::string(70000, 'x')}});
        std::cerr << "[encode] oversized header accepted\n";
        ok = false;
    } catch (const EncodingError &) {
    }

    return ok;
}

bool test_decode_rejects_non_objects() {
    const auto decodeText = [](const std::string &text) {
        return decodeHeader(std::span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
    };

    for (const std::string bad : {"{not json", "[1,2,3]", "\"text\"", ""}) {
        try {
            (void)decodeText(bad);
            std::cerr << "[decode] accepted '" << bad << "'\n";
            return false;
        } catch (const MalformedHeaderError &) {
        }
    }

    try {
        (void)decodeHeader({}, "ascii");
        std::cerr << "[decode] unsupported encoding accepted\n";
        return false;
    } catch (const EncodingError &) {
    }
    return true;
}

bool test_required_field_validation() {
    Header h = sampleHeader();
    h.erase("content-size");
    h.erase("byteorder");

    const auto missing = missingHeaderFields(h);
    if (missing != std::vector<std::string>{"byteorder", "content-size"}) {
        std::cerr << "[required] unexpected missing list\n";
        return false;
    }

    try {
        requireHeaderFields(h);
        std::cerr << "[required] missing fields accepted\n";
        return false;
    } catch (const MissingHeaderFieldError &e) {
        if (e.fields() != missing) {
            std::cerr << "[required] exception lists wrong fields\n";
            return false;
        }
    }

    Header negative = sampleHeader();
    negative["content-size"] = -5;
    try {
        requireHeaderFields(negative);
        std::cerr << "[required] negative content-size accepted\n";
        return false;
    } catch (const MalformedHeaderError &) {
    }

    Header textual = sampleHeader();
    textual["content-size"] = "10";
    try {
        requireHeaderFields(textual);
        std::cerr << "[required] string content-size accepted\n";
        return false;
    } catch (const MalformedHeaderError &) {
    }

    const Header good = sampleHeader();
    requireHeaderFields(good);
    if (contentSize(good) != 10000 || contentProtocol(good) != "FileTransfer") {
        std::cerr << "[required] accessors mismatch\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_round_trip_with_extras();
    ok = ok && test_injects_byteorder_and_default_encoding();
    ok = ok && test_encoding_errors();
    ok = ok && test_decode_rejects_non_objects();
    ok = ok && test_required_field_validation();

    if (!ok) {
        std::cerr << "FrameCodec tests FAILED\n";
        return 1;
    }

    std::cout << "FrameCodec tests PASSED\n";
    return 0;
}
