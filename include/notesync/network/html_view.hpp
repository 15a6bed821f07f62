#pragma once

#include <string>
#include "base64.hpp"

namespace notesync {
namespace network {

/**
 * @brief Read-only browser view of the document.
 * The content is embedded base64-encoded, so no escaping is needed, and
 * rendered as Markdown client side.
 */
inline std::string renderHtmlView(const std::string& content) {
    static const char* kHead = R"(<!DOCTYPE html>
<html>
    <head>
        <meta http-equiv="Content-Type" content="text/html; charset=utf-8" />
        <script type="text/javascript" src="https://cdnjs.cloudflare.com/ajax/libs/showdown/1.7.6/showdown.min.js"></script>
        <title>notesync</title>
    </head>
    <body>
        <div id="file" hidden>)";

    static const char* kTail = R"(</div>
        <div id="view" style="width: 600px; padding: 0 10px"></div>
        <script type="text/javascript">
        (function (d, s){
            var file = d.getElementById("file").textContent;
            d.getElementById("view").innerHTML = (new s.Converter()).makeHtml(atob(file));
        })(document, showdown)
        </script>
    </body>
</html>
)";

    std::string html(kHead);
    html += Base64::encode(content);
    html += kTail;
    return html;
}

} // namespace network
} // namespace notesync
