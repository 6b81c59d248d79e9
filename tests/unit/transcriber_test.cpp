#include <cassert>
#include <string>
#include "transcriber.hpp"

int main() {
    assert(extract_text_field(R"({"text" : "what time is it"})") == "what time is it");
    assert(extract_text_field(R"({"text": "say \"hi\"\nnow"})") == "say \"hi\"\nnow");
    assert(extract_text_field(R"({"result": [], "text": ""})").empty());
    assert(extract_text_field(R"({"partial": "what"})").empty());

    for (const char* bad : {"", "{\"text\": ", "[1, 2]"}) {
        bool threw = false;
        try {
            extract_text_field(bad);
        } catch (const RecognitionError&) {
            threw = true;
        }
        assert(threw);
    }
    return 0;
}
