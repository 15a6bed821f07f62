#include <iostream>
#include <cassert>
#include <string>
#include "notesync/network/base64.hpp"
#include "notesync/network/html_view.hpp"

using namespace notesync::network;

/**
 * Test 1: Padding for 1, 2 and 3 byte tails
 */
void test_padding() {
    std::cout << "Test 1: Padding..." << std::endl;

    assert(Base64::encode("") == "");
    assert(Base64::encode("M") == "TQ==");
    assert(Base64::encode("Ma") == "TWE=");
    assert(Base64::encode("Man") == "TWFu");
    assert(Base64::encode("hello world") == "aGVsbG8gd29ybGQ=");

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 2: High bytes use the + and / characters
 */
void test_binary() {
    std::cout << "Test 2: Binary input..." << std::endl;

    std::string bytes;
    bytes.push_back(static_cast<char>(0xFB));
    bytes.push_back(static_cast<char>(0xFF));
    bytes.push_back(static_cast<char>(0xFE));
    assert(Base64::encode(bytes) == "+//+");

    std::string zeros(3, '\0');
    assert(Base64::encode(zeros) == "AAAA");

    // UTF-8 text survives as raw bytes
    assert(Base64::encode("\xC3\xA9") == "w6k=");

    std::cout << "  PASS" << std::endl;
}

/**
 * Test 3: Output size is always a multiple of 4
 */
void test_encoded_size() {
    std::cout << "Test 3: Encoded size..." << std::endl;

    for (size_t n = 0; n < 64; n++) {
        std::string in(n, 'x');
        std::string out = Base64::encode(in);
        assert(out.size() == Base64::encodedSize(n));
        assert(out.size() % 4 == 0);
    }

    std::cout << "  Checked sizes 0..63" << std::endl;
    std::cout << "  PASS" << std::endl;
}

/**
 * Test 4: The HTML view embeds the document encoded, never raw
 */
void test_html_view() {
    std::cout << "Test 4: HTML view..." << std::endl;

    std::string doc = "# Title\n<script>alert(1)</script>\n";
    std::string html = renderHtmlView(doc);

    assert(html.find("<!DOCTYPE html>") == 0);
    assert(html.find(Base64::encode(doc)) != std::string::npos);
    assert(html.find("alert(1)") == std::string::npos);
    assert(html.find("showdown") != std::string::npos);
    assert(html.find("atob(") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== notesync Base64 Tests ===" << std::endl << std::endl;

    test_padding();
    test_binary();
    test_encoded_size();
    test_html_view();

    std::cout << std::endl << "=== ALL TESTS PASSED ===" << std::endl;
    return 0;
}
