#include <gtest/gtest.h>
#include "protocols/http/model/Request.hpp"
#include "util/files.hpp"
#include "util/http.hpp"
#include "util/parse.hpp"

using namespace rf;
using namespace rf::image::model;
using rf::protocols::http::model::Request;

TEST(RequestTest, WidthAndHeightRoute) {
    const auto r = Request::parse("/images/resized/800/600/cat.jpg");
    ASSERT_TRUE(r.has_value());
    const auto* wh = std::get_if<WidthAndHeight>(&r->to.to);
    ASSERT_NE(wh, nullptr);
    EXPECT_EQ(wh->width, 800u);
    EXPECT_EQ(wh->height, 600u);
    EXPECT_EQ(r->image, "cat.jpg");
    EXPECT_EQ(r->encoding, Encoding::Avif);
}

TEST(RequestTest, KeywordRoutes) {
    const auto w = Request::parse("/images/resized/width/640/cat.jpg/jpeg");
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(std::get<Width>(w->to.to).width, 640u);
    EXPECT_EQ(w->encoding, Encoding::Jpeg);

    const auto h = Request::parse("/images/resized/height/480/cat.jpg/avif");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(std::get<Height>(h->to.to).height, 480u);
    EXPECT_EQ(h->encoding, Encoding::Avif);

    const auto s = Request::parse("/images/resized/scale/0.25/cat.jpg");
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(std::get<Scale>(s->to.to).factor, 0.25);
}

TEST(RequestTest, QueryStringAndDoubleSlashesAreIgnored) {
    const auto r = Request::parse("/images//resized/width/10/cat.jpg?cache=no");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->image, "cat.jpg");
}

TEST(RequestTest, SegmentsArePercentDecoded) {
    const auto r = Request::parse("/images/resized/width/10/my%20cat.jpg");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->image, "my cat.jpg");

    // An encoded slash decodes into the name and is rejected later by the resolver.
    const auto slash = Request::parse("/images/resized/width/10/..%2Fsecret.jpg");
    ASSERT_TRUE(slash.has_value());
    EXPECT_EQ(slash->image, "../secret.jpg");
}

TEST(RequestTest, UnknownRoutesAreNullopt) {
    EXPECT_FALSE(Request::parse("/").has_value());
    EXPECT_FALSE(Request::parse("/images/resized").has_value());
    EXPECT_FALSE(Request::parse("/images/resized/width/10").has_value());
    EXPECT_FALSE(Request::parse("/images/original/width/10/cat.jpg").has_value());
    EXPECT_FALSE(Request::parse("/images/resized/width/10/cat.jpg/avif/extra").has_value());
}

TEST(RequestTest, MalformedValuesThrow) {
    EXPECT_THROW(Request::parse("/images/resized/width/abc/cat.jpg"), std::invalid_argument);
    EXPECT_THROW(Request::parse("/images/resized/width/-5/cat.jpg"), std::invalid_argument);
    EXPECT_THROW(Request::parse("/images/resized/scale/fast/cat.jpg"), std::invalid_argument);
    EXPECT_THROW(Request::parse("/images/resized/100/1e3/cat.jpg"), std::invalid_argument);
    EXPECT_THROW(Request::parse("/images/resized/width/10/cat.jpg/webp"), std::invalid_argument);
    EXPECT_THROW(Request::parse("/images/resized/width/10/cat%zz.jpg"), std::invalid_argument);
}

TEST(RequestTest, ZeroParsesAndIsLeftToThePipeline) {
    const auto r = Request::parse("/images/resized/0/100/cat.jpg");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(std::get<WidthAndHeight>(r->to.to).width, 0u);
}

TEST(UtilTest, UrlDecode) {
    EXPECT_EQ(util::url_decode("a%2Fb"), "a/b");
    EXPECT_EQ(util::url_decode("a+b"), "a+b");
    EXPECT_EQ(util::url_decode("%41%62"), "Ab");
    EXPECT_THROW(util::url_decode("%4"), std::invalid_argument);
    EXPECT_THROW(util::url_decode("%"), std::invalid_argument);
}

TEST(UtilTest, SplitPath) {
    EXPECT_EQ(util::split_path("/a/b//c?x=1"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(util::split_path("/").empty());
    EXPECT_TRUE(util::split_path("").empty());
}

TEST(UtilTest, ResolveUnderAcceptsPlainNames) {
    const auto p = util::resolveUnder("/srv/images", "cat.jpg");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, std::filesystem::path("/srv/images/cat.jpg"));

    EXPECT_TRUE(util::resolveUnder("images", "..cat.jpg").has_value());
}

TEST(UtilTest, ResolveUnderRejectsEscapes) {
    for (const auto* bad : {"", ".", "..", "../etc/passwd", "a/b.jpg", "a\\b.jpg", "/etc/passwd"})
        EXPECT_FALSE(util::resolveUnder("/srv/images", bad).has_value()) << bad;
}

TEST(UtilTest, ParseNumbers) {
    EXPECT_EQ(util::parseUInt("42"), 42u);
    EXPECT_FALSE(util::parseUInt("").has_value());
    EXPECT_FALSE(util::parseUInt("+1").has_value());
    EXPECT_FALSE(util::parseUInt("99999999999").has_value());
    EXPECT_DOUBLE_EQ(*util::parseDouble("2.5"), 2.5);
    EXPECT_FALSE(util::parseDouble("2.5x").has_value());
    EXPECT_FALSE(util::parseDouble(" 2").has_value());
}
