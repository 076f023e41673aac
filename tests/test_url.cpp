#include <catch2/catch.hpp>
#include <stdexcept>
#include "common/url.hpp"


TEST_CASE("ws url with port and path"){
auto u = parse_url("ws://10.0.0.5:8080/ws");
REQUIRE(u.scheme=="ws"); REQUIRE(u.host=="10.0.0.5"); REQUIRE(u.port=="8080"); REQUIRE(u.target=="/ws");
REQUIRE(u.host_header()=="10.0.0.5:8080");
}


TEST_CASE("defaults: port 80 and root target"){
auto u = parse_url("WS://charttool.local");
REQUIRE(u.scheme=="ws"); REQUIRE(u.host=="charttool.local"); REQUIRE(u.port=="80"); REQUIRE(u.target=="/");
REQUIRE(u.host_header()=="charttool.local");
auto h = parse_url("http://192.168.1.20:9000/info?x=1");
REQUIRE(h.port=="9000"); REQUIRE(h.target=="/info?x=1");
}


TEST_CASE("bracketed IPv6 host"){
auto u = parse_url("ws://[::1]:9000/ws");
REQUIRE(u.host=="::1"); REQUIRE(u.port=="9000");
REQUIRE(u.host_header()=="[::1]:9000");
}


TEST_CASE("rejected urls"){
REQUIRE_THROWS_AS(parse_url("10.0.0.5:8080/ws"), std::invalid_argument);
REQUIRE_THROWS_AS(parse_url("wss://10.0.0.5/ws"), std::invalid_argument);
REQUIRE_THROWS_AS(parse_url("ftp://10.0.0.5/ws"), std::invalid_argument);
REQUIRE_THROWS_AS(parse_url("ws://:8080/ws"), std::invalid_argument);
REQUIRE_THROWS_AS(parse_url("ws://host:99999/ws"), std::invalid_argument);
REQUIRE_THROWS_AS(parse_url("ws://host:80a/ws"), std::invalid_argument);
REQUIRE_THROWS_AS(parse_url("ws://[::1:80/ws"), std::invalid_argument);
}


TEST_CASE("port values"){
REQUIRE(parse_port("55555")==55555); REQUIRE(parse_port("1")==1); REQUIRE(parse_port("65535")==65535);
REQUIRE(parse_port("0", true)==0);
REQUIRE_THROWS_AS(parse_port("0"), std::invalid_argument);
REQUIRE_THROWS_AS(parse_port("70000"), std::invalid_argument);
REQUIRE_THROWS_AS(parse_port("65536"), std::invalid_argument);
REQUIRE_THROWS_AS(parse_port("-1"), std::invalid_argument);
REQUIRE_THROWS_AS(parse_port(""), std::invalid_argument);
REQUIRE_THROWS_AS(parse_port("8o8o"), std::invalid_argument);
}
