#include "minitest.hpp"
#include "auth/Cookies.hpp"
#include "util/Crypto.hpp"
#include "util/Strings.hpp"

using namespace vipervault;

TEST(cookie_find_among_several) {
  auto v = auth::find_cookie("theme=dark; session_token=abc123; other=1", "session_token");
  ASSERT_TRUE(v.has_value());
  ASSERT_EQ(*v, std::string("abc123"));
  ASSERT_FALSE(auth::find_cookie("theme=dark", "session_token").has_value());
  ASSERT_FALSE(auth::find_cookie("", "session_token").has_value());
}

TEST(cookie_name_must_match_exactly) {
  ASSERT_FALSE(auth::find_cookie("xsession_token=1", "session_token").has_value());
  auto v = auth::extract_session_token("session_token=\"quoted\"");
  ASSERT_TRUE(v.has_value());
  ASSERT_EQ(*v, std::string("quoted"));
}

TEST(cookie_session_attributes) {
  auto c = auth::make_session_cookie("tok", 86400, false);
  ASSERT_EQ(c, std::string("session_token=tok; Path=/; Max-Age=86400; HttpOnly; SameSite=Lax"));
  auto s = auth::make_session_cookie("tok", 60, true);
  ASSERT_CONTAINS(s, "; Secure");
}

TEST(cookie_clear_expires_immediately) {
  auto c = auth::make_clear_cookie(false);
  ASSERT_CONTAINS(c, "session_token=;");
  ASSERT_CONTAINS(c, "Max-Age=0");
}

TEST(password_comparison) {
  ASSERT_TRUE(auth::password_matches("hunter2", "hunter2"));
  ASSERT_FALSE(auth::password_matches("hunter3", "hunter2"));
  ASSERT_FALSE(auth::password_matches("hunter", "hunter2"));
  ASSERT_FALSE(auth::password_matches("", "hunter2"));
}

TEST(crypto_base64url_alphabet) {
  const unsigned char bytes[] = {0xfb, 0xff, 0xfe};
  ASSERT_EQ(util::base64url_encode(bytes, sizeof(bytes)), std::string("-__-"));
  const unsigned char two[] = {'h', 'i'};
  ASSERT_EQ(util::base64url_encode(two, sizeof(two)), std::string("aGk"));
}

TEST(crypto_random_token_length) {
  auto t = util::random_token(32);
  ASSERT_TRUE(t.has_value());
  ASSERT_EQ(t->size(), 43u);
  ASSERT_NE(*t, *util::random_token(32));
}

TEST(strings_redact_keeps_prefix) {
  ASSERT_EQ(util::redact("abcdefghij"), std::string("abcdef..."));
  ASSERT_EQ(util::redact("abc"), std::string("***"));
}
