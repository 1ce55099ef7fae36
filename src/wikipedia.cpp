#include <coincidence/wikipedia.hpp>
#include <coincidence/configuration.hpp>
#include <coincidence/http.hpp>
#include <coincidence/markup.hpp>

#include <stdexcept>

namespace coincidence {

std::string Article::text() const
{
    return strip_markup(markup_text(markup));
}

Wikipedia::Wikipedia(std::string_view random_url, std::string_view export_url, std::string_view user_agent)
: random_url_(random_url)
, export_url_(export_url)
, user_agent_(user_agent)
{ }

Wikipedia Wikipedia::from(Configuration & config)
{
    auto setting = [&](std::string_view key, std::string_view dflt) {
        std::string_view value = trim(config[coincidence::span<std::string_view>({"wikipedia", key})]);
        return std::string(value.empty() ? dflt : value);
    };
    return Wikipedia(
        setting("random_url", RANDOM_URL),
        setting("export_url", EXPORT_URL),
        setting("user_agent", USER_AGENT)
    );
}

Article Wikipedia::random_article() const
{
    HTTP::Header headers[] = {{"User-Agent", user_agent_}};
    HTTP::Response redirect = HTTP::request(random_url_, headers);
    if (redirect.status / 100 != 3 || redirect.location.empty()) {
        throw std::runtime_error("Expected a redirect from " + random_url_ + ", got HTTP " + std::to_string(redirect.status));
    }
    std::string title = title_from_location(redirect.location);
    if (title.empty()) {
        throw std::runtime_error("No article title in redirect to " + redirect.location);
    }
    return article(title);
}

std::vector<Article> Wikipedia::random_articles(size_t count) const
{
    std::vector<Article> articles;
    articles.reserve(count);
    for (size_t index = 0; index < count; ++ index) {
        articles.emplace_back(random_article());
    }
    return articles;
}

Article Wikipedia::article(std::string_view title) const
{
    HTTP::Header headers[] = {{"User-Agent", user_agent_}};
    return {
        std::string(title),
        HTTP::request_string(export_url_ + std::string(title), headers)
    };
}

std::string Wikipedia::title_from_location(std::string_view location)
{
    location = location.substr(0, location.find_first_of("?#"));
    return std::string(last_segment(location));
}

} // namespace coincidence
