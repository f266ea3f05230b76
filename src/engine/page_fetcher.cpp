#include "page_fetcher.hpp"
#include "http.hpp"
#include "text.hpp"
#include "incidex/errors.hpp"
#include <gumbo.h>

namespace incidex::engine {

    namespace {

        const char* const kIncidentKeywords[] = {"incident", "incidencia", "issue", "ticket"};

        class HttpFetcher : public PageFetcher {
        public:
            explicit HttpFetcher(long timeout_seconds) : m_timeout(timeout_seconds) {}

            std::string fetch(const std::string& url) override {
                auto response = http::get(url, m_timeout);
                if (!response.error.empty()) {
                    throw Error(ErrorKind::SourceNotFound, "fetch failed for " + url + ": " + response.error);
                }
                if (response.status >= 400) {
                    throw Error(ErrorKind::SourceNotFound, "HTTP " + std::to_string(response.status) + " for " + url);
                }
                return response.body;
            }

        private:
            long m_timeout;
        };

        bool is_incident_block(const GumboElement& element) {
            if (element.tag != GUMBO_TAG_DIV && element.tag != GUMBO_TAG_LI && element.tag != GUMBO_TAG_TR) {
                return false;
            }
            const GumboAttribute* cls = gumbo_get_attribute(&element.attributes, "class");
            if (!cls) return false;
            std::string classes = text::to_lower(cls->value);
            for (const char* keyword : kIncidentKeywords) {
                if (classes.find(keyword) != std::string::npos) return true;
            }
            return false;
        }

        void collect_text(const GumboNode* node, std::string& out) {
            if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA) {
                std::string piece = text::trim(node->v.text.text);
                if (piece.empty()) return;
                if (!out.empty()) out.push_back(' ');
                out += piece;
                return;
            }
            if (node->type != GUMBO_NODE_ELEMENT) return;
            if (node->v.element.tag == GUMBO_TAG_SCRIPT || node->v.element.tag == GUMBO_TAG_STYLE) return;

            const GumboVector& children = node->v.element.children;
            for (unsigned int i = 0; i < children.length; ++i) {
                collect_text(static_cast<const GumboNode*>(children.data[i]), out);
            }
        }

        void find_blocks(const GumboNode* node, std::vector<std::string>& blocks) {
            if (node->type != GUMBO_NODE_ELEMENT) return;
            if (is_incident_block(node->v.element)) {
                std::string text;
                collect_text(node, text);
                blocks.push_back(std::move(text));
            }
            const GumboVector& children = node->v.element.children;
            for (unsigned int i = 0; i < children.length; ++i) {
                find_blocks(static_cast<const GumboNode*>(children.data[i]), blocks);
            }
        }

    }

    std::unique_ptr<PageFetcher> create_http_fetcher(long timeout_seconds) {
        return std::make_unique<HttpFetcher>(timeout_seconds);
    }

    std::vector<std::string> extract_incident_blocks(const std::string& html) {
        std::vector<std::string> blocks;
        GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
        find_blocks(output->root, blocks);
        gumbo_destroy_output(&kGumboDefaultOptions, output);
        return blocks;
    }

}
