#include "infra/ProviderClients.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <memory>

namespace {

struct ClientFixture : public ::testing::Test {
  ProviderEndpoints endpoints;
  Point from = make_point(37.5, 127.0, "City Hall");
  Point to = make_point(37.5796, 126.977, "Gyeongbokgung");
};

} // namespace

TEST(ProviderClients, FormatCoordinateIsShortest) {
  EXPECT_EQ(format_coordinate(127.0), "127");
  EXPECT_EQ(format_coordinate(37.5), "37.5");
  EXPECT_EQ(format_coordinate(127.01), "127.01");
  EXPECT_EQ(format_coordinate(-0.125), "-0.125");
}

// ---------------------- Kakao ----------------------------------------------

TEST_F(ClientFixture, KakaoRequestShape) {
  auto fetcher = std::make_shared<FakeFetcher>(std::vector<HttpReply>{
      ok_reply(R"({"routes":[{"summary":{"distance":1000,"duration":60}}]})")});
  KakaoDirectionsClient client(fetcher, endpoints.kakao, "kakao-secret");
  client.estimate(from, to);

  ASSERT_EQ(fetcher->requests.size(), 1u);
  const auto &req = fetcher->requests.front();
  EXPECT_EQ(req.base_url, "https://apis-navi.kakaomobility.com");
  EXPECT_EQ(req.path, "/v1/directions");
  EXPECT_EQ(FakeFetcher::query_value(req, "origin"), "127,37.5");
  EXPECT_EQ(FakeFetcher::query_value(req, "destination"), "126.977,37.5796");
  EXPECT_EQ(FakeFetcher::query_value(req, "priority"), "RECOMMEND");
  EXPECT_EQ(FakeFetcher::query_value(req, "alternatives"), "false");
  EXPECT_EQ(FakeFetcher::query_value(req, "road_details"), "false");
  ASSERT_EQ(req.headers.size(), 1u);
  EXPECT_EQ(req.headers[0].first, "Authorization");
  EXPECT_EQ(req.headers[0].second, "KakaoAK kakao-secret");
  EXPECT_EQ(fetcher->timeouts.front(), std::chrono::milliseconds(4000));
}

TEST(KakaoParse, MetresAndSecondsAreNormalised) {
  auto out = KakaoDirectionsClient::parseReply(ok_reply(
      R"({"routes":[{"result_code":0,"summary":{"distance":12340,"duration":1830}}]})"));
  ASSERT_TRUE(out.ok) << out.error;
  EXPECT_DOUBLE_EQ(out.value.distance_km, 12.34);
  EXPECT_DOUBLE_EQ(out.value.duration_min, 30.5);
  EXPECT_EQ(out.value.provider, ProviderId::Kakao);
}

TEST(KakaoParse, NumericStringsAccepted) {
  auto out = KakaoDirectionsClient::parseReply(ok_reply(
      R"({"routes":[{"summary":{"distance":"1500","duration":" 90 "}}]})"));
  ASSERT_TRUE(out.ok) << out.error;
  EXPECT_DOUBLE_EQ(out.value.distance_km, 1.5);
  EXPECT_DOUBLE_EQ(out.value.duration_min, 1.5);
}

TEST(KakaoParse, MissingSummaryFails) {
  auto out = KakaoDirectionsClient::parseReply(
      ok_reply(R"({"routes":[{"result_code":0}]})"));
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.error, "Kakao response missing distance/duration");
}

TEST(KakaoParse, ResultCodeBecomesReason) {
  auto out = KakaoDirectionsClient::parseReply(ok_reply(
      R"({"routes":[{"result_code":104,"result_msg":"too close"}]})"));
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.error, "Kakao result 104: too close");

  out = KakaoDirectionsClient::parseReply(
      ok_reply(R"({"routes":[{"result_code":105}]})"));
  EXPECT_EQ(out.error, "Kakao result 105");
}

TEST(KakaoParse, NonNumericFieldFails) {
  auto out = KakaoDirectionsClient::parseReply(ok_reply(
      R"({"routes":[{"summary":{"distance":"far","duration":10}}]})"));
  EXPECT_FALSE(out.ok);
}

TEST(KakaoParse, EmptyRoutesFails) {
  EXPECT_FALSE(KakaoDirectionsClient::parseReply(ok_reply(R"({"routes":[]})")).ok);
  EXPECT_FALSE(KakaoDirectionsClient::parseReply(ok_reply(R"([1,2,3])")).ok);
}

TEST(KakaoParse, HttpStatusFails) {
  auto out = KakaoDirectionsClient::parseReply(ok_reply("{}", 401));
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.error, "HTTP 401");
}

TEST(KakaoParse, InvalidJsonFails) {
  auto out = KakaoDirectionsClient::parseReply(ok_reply("<html>oops</html>"));
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.error, "invalid JSON response");
}

TEST(KakaoParse, TimeoutFails) {
  auto out = KakaoDirectionsClient::parseReply(timeout_reply(4000));
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.error, "timed out after 4000 ms");
}

TEST(KakaoParse, CancelledCallIgnoresLateBody) {
  HttpReply r = ok_reply(
      R"({"routes":[{"result_code":0,"summary":{"distance":1000,"duration":60}}]})");
  r.timed_out = true;
  auto out = KakaoDirectionsClient::parseReply(r);
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.error, "timed out");
}

// ---------------------- ODsay ----------------------------------------------

TEST_F(ClientFixture, OdsayRequestShape) {
  auto fetcher = std::make_shared<FakeFetcher>(std::vector<HttpReply>{
      ok_reply(R"({"result":{"path":[{"info":{"totalDistance":1,"totalTime":1}}]}})")});
  OdsayTransitClient client(fetcher, endpoints.odsay, "odsay-secret");
  client.estimate(from, to);

  ASSERT_EQ(fetcher->requests.size(), 1u);
  const auto &req = fetcher->requests.front();
  EXPECT_EQ(req.base_url, "https://api.odsay.com");
  EXPECT_EQ(req.path, "/v1/api/searchPubTransPathT");
  EXPECT_EQ(FakeFetcher::query_value(req, "SX"), "127");
  EXPECT_EQ(FakeFetcher::query_value(req, "SY"), "37.5");
  EXPECT_EQ(FakeFetcher::query_value(req, "EX"), "126.977");
  EXPECT_EQ(FakeFetcher::query_value(req, "EY"), "37.5796");
  EXPECT_EQ(FakeFetcher::query_value(req, "apiKey"), "odsay-secret");
  EXPECT_TRUE(req.headers.empty());
  EXPECT_EQ(fetcher->timeouts.front(), std::chrono::milliseconds(4500));
}

TEST(OdsayParse, MinutesPassThrough) {
  auto out = OdsayTransitClient::parseReply(ok_reply(
      R"({"result":{"path":[{"pathType":1,"info":{"totalDistance":8200,"totalTime":35}}]}})"));
  ASSERT_TRUE(out.ok) << out.error;
  EXPECT_DOUBLE_EQ(out.value.distance_km, 8.2);
  EXPECT_DOUBLE_EQ(out.value.duration_min, 35.0);
  EXPECT_EQ(out.value.provider, ProviderId::Odsay);
}

TEST(OdsayParse, ErrorEnvelopeObject) {
  auto out = OdsayTransitClient::parseReply(
      ok_reply(R"({"error":{"code":-98,"msg":"no route within 700m"}})"));
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.error, "ODSAY error: no route within 700m");
}

TEST(OdsayParse, ErrorEnvelopeArray) {
  auto out = OdsayTransitClient::parseReply(ok_reply(
      R"({"error":[{"code":"500","message":"ApiKeyAuthFailed"}]})"));
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.error, "ODSAY error: ApiKeyAuthFailed");
}

TEST(OdsayParse, MissingInfoFails) {
  auto out = OdsayTransitClient::parseReply(
      ok_reply(R"({"result":{"path":[{"info":{"totalDistance":100}}]}})"));
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.error, "ODSAY response missing distance/time");
}

TEST(OdsayParse, TransportErrorFails) {
  HttpReply r;
  r.error = "Connection";
  auto out = OdsayTransitClient::parseReply(r);
  EXPECT_FALSE(out.ok);
  EXPECT_EQ(out.error, "Connection");
}
