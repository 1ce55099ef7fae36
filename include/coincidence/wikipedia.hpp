#pragma once

#include <coincidence/common.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace coincidence {

class Configuration;

struct Article
{
    std::string title;
    std::string markup; // Special:Export XML

    // Parse and filter the page to get just the article text.
    std::string text() const;
};

class Wikipedia
{
public:
    static constexpr std::string_view RANDOM_URL = "https://en.wikipedia.org/wiki/Special:Random/";
    static constexpr std::string_view EXPORT_URL = "https://en.wikipedia.org/wiki/Special:Export/";
    // Wikipedia rejects generic client user-agents to discourage crawlers.
    static constexpr std::string_view USER_AGENT = "coincidence/0.1";

    Wikipedia(
        std::string_view random_url = RANDOM_URL,
        std::string_view export_url = EXPORT_URL,
        std::string_view user_agent = USER_AGENT
    );

    /*
     * Read [wikipedia] random_url, export_url and user_agent,
     * using the defaults above for any that are unset.
     */
    static Wikipedia from(Configuration & config);

    /*
     * The random URL redirects to a random article; the title is the last
     * segment of the redirect target. The export URL then returns the article
     * with less of the boilerplate around it.
     */
    Article random_article() const;
    std::vector<Article> random_articles(size_t count) const;

    Article article(std::string_view title) const;

    static std::string title_from_location(std::string_view location);

    std::string const& random_url() const { return random_url_; }
    std::string const& export_url() const { return export_url_; }
    std::string const& user_agent() const { return user_agent_; }

private:
    std::string random_url_;
    std::string export_url_;
    std::string user_agent_;
};

} // namespace coincidence
