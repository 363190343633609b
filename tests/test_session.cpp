#include <gtest/gtest.h>
#include <session.hpp>
#include <thread>
#include <ctime>
#include "testutil.hpp"


static std::string thisYear() {
    time_t now = time(NULL);
    struct tm parts;
    localtime_r(&now, &parts);
    char year[16];
    strftime(year, sizeof(year), "%Y", &parts);
    return year;
}


class test_session : public ::testing::Test {
protected:
    TempDir dir;
    Context ctx;

    void SetUp() override {
        ASSERT_FALSE(dir.path.empty());
        ctx["name"] = "Bob";
        ASSERT_TRUE(dir.write("page.html", "<h1>{{ name }}</h1>{% include \"footer\" %}"));
        ASSERT_TRUE(dir.write("footer.html", "<footer>{{ name|lower }}</footer>"));
    }
};


TEST_F(test_session, render_file_is_cached) {
    Session session(dir.path);
    std::string first = session.renderFile(dir.file("page.html"), ctx);
    EXPECT_EQ(first, "<h1>Bob</h1><footer>bob</footer>");
    std::string second = session.renderFile(dir.file("page.html"), ctx);
    EXPECT_EQ(first, second);
    CacheStats stats = session.cacheStats();
    EXPECT_EQ(stats.misses, 2u); // page and footer
    EXPECT_EQ(stats.hits, 2u);
    session.clearCache();
    EXPECT_EQ(session.cacheStats().size, 0u);
}

TEST_F(test_session, render_template_by_name) {
    Session session;
    EXPECT_EQ(session.renderTemplate("page.html", ctx).rfind("<!-- Template error: Cannot render page.html: template directory not set", 0), 0u);
    session.setTemplateDir(dir.path + "/");
    EXPECT_EQ(session.getTemplateDir(), dir.path);
    EXPECT_EQ(session.renderTemplate("page.html", ctx), "<h1>Bob</h1><footer>bob</footer>");
}

TEST_F(test_session, files_resolve_includes_from_their_own_directory) {
    Session session;
    EXPECT_EQ(session.renderFile(dir.file("page.html"), ctx), "<h1>Bob</h1><footer>bob</footer>");
}

TEST_F(test_session, template_directory_normalisation) {
    Session session;
    session.setTemplateDir("some\\windows\\path\\");
    EXPECT_EQ(session.getTemplateDir(), "some/windows/path");
    session.setTemplateDir("/");
    EXPECT_EQ(session.getTemplateDir(), "/");
}

TEST_F(test_session, missing_file_goes_to_the_error_handler) {
    Session session(dir.path);
    std::string out = session.renderFile(dir.file("nope.html"), ctx);
    EXPECT_EQ(out.rfind("<!-- Template error: Cannot open template file: " + dir.file("nope.html") + " (", 0), 0u) << out;
}

TEST_F(test_session, custom_error_handler) {
    Session session(dir.path);
    std::vector<std::string> seen;
    session.setErrorHandler([&seen](const std::string& message) {
        seen.push_back(message);
        return std::string("[error]");
    });
    EXPECT_EQ(session.renderFile(dir.file("nope.html"), ctx), "[error]");
    EXPECT_EQ(session.renderString((const char*)NULL, ctx), "[error]");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1], "Cannot compile a nil template string");

    // inline problems don't reach the handler
    EXPECT_EQ(session.renderString("{% if name %}x", ctx), "x<!-- Unclosed block: if -->");
    EXPECT_EQ(seen.size(), 2u);

    session.resetErrorHandler();
    EXPECT_EQ(session.renderString((const char*)NULL, ctx), "<!-- Template error: Cannot compile a nil template string -->");
    session.setErrorHandler([](const std::string& message) { return std::string("again"); });
    session.setErrorHandler(ErrorHandler());
    EXPECT_EQ(session.handleError("boom"), "<!-- Template error: boom -->");
}

TEST_F(test_session, compile_and_render) {
    Session session;
    std::string error;
    EXPECT_FALSE(session.compile(NULL, &error));
    EXPECT_EQ(error, "Cannot compile a nil template string");
    EXPECT_EQ(session.render(std::shared_ptr<Template>(), ctx), "<!-- Template error: Nothing to render, the template is not compiled -->");
    std::shared_ptr<Template> tmpl = session.compile("Hi {{ name }}");
    ASSERT_TRUE(tmpl);
    EXPECT_EQ(session.render(tmpl, ctx), "Hi Bob");
}

TEST_F(test_session, ambient_variables) {
    Session session(dir.path);
    EXPECT_EQ(session.renderString("{{ current_year }}", ctx), thisYear());
    std::string date = session.renderString("{{ current_date }}", ctx);
    EXPECT_EQ(date.size(), 10u);
    EXPECT_EQ(date.substr(0, 4), thisYear());
    EXPECT_EQ(session.renderString("{{ _template_dir }}", ctx), dir.path);

    ctx["current_year"] = "1999"; // ambient values win
    EXPECT_EQ(session.renderString("{{ current_year }}", ctx), thisYear());
    EXPECT_EQ(ctx["current_year"].toString(), "1999"); // and the caller's context is untouched
}

TEST_F(test_session, sessions_are_independent) {
    Session one(dir.path);
    Session two;
    one.registerFilter("shout", [](const Value& v, const std::vector<Value>& args) {
        return Value(v.toString() + "!");
    });
    one.setMaxNesting(1);
    EXPECT_TRUE(one.hasFilter("shout"));
    EXPECT_FALSE(two.hasFilter("shout"));
    EXPECT_EQ(two.renderString("{{ name|shout }}", ctx), "Bob");
    EXPECT_EQ(two.getMaxNesting(), STENCIL_DEFAULT_MAX_NESTING);
    EXPECT_EQ(two.getTemplateDir(), "");
}

TEST_F(test_session, cache_configuration) {
    Session session(dir.path);
    session.setMaxCacheSize(1);
    session.renderFile(dir.file("page.html"), ctx);
    CacheStats stats = session.cacheStats();
    EXPECT_EQ(stats.size, 1u);
    EXPECT_EQ(stats.maxSize, 1u);

    session.setCacheEnabled(false);
    EXPECT_EQ(session.renderFile(dir.file("page.html"), ctx), "<h1>Bob</h1><footer>bob</footer>");
    EXPECT_EQ(session.cacheStats().size, 0u);
    EXPECT_FALSE(session.cacheStats().enabled);
}

TEST_F(test_session, debug_mode_renders_the_same) {
    Session session(dir.path);
    session.setDebug(true);
    EXPECT_TRUE(session.debug());
    EXPECT_EQ(session.renderFile(dir.file("page.html"), ctx), "<h1>Bob</h1><footer>bob</footer>");
}

TEST_F(test_session, concurrent_renders) {
    Session session(dir.path);
    session.setMaxCacheSize(1); // force evictions while other threads still render the evicted trees
    std::vector<std::thread> threads;
    std::vector<int> failures(8, 0);
    for (int t = 0; t < 8; t ++) {
        threads.emplace_back([&, t]() {
            Context mine;
            mine["name"] = "User" + std::to_string(t);
            std::string expected = "<h1>User" + std::to_string(t) + "</h1><footer>user" + std::to_string(t) + "</footer>";
            for (int i = 0; i < 100; i ++) {
                if (session.renderFile(dir.file("page.html"), mine) != expected) {
                    failures[t] ++;
                }
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }
    for (int t = 0; t < 8; t ++) {
        EXPECT_EQ(failures[t], 0) << "thread " << t;
    }
}
