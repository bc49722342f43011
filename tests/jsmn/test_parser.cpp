#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<assert.h>
#include<sstream>
#include<string>
#include<vector>

namespace {

/* A getrawtransaction reply as bitcoind sends it.  */
auto const reply = std::string(R"JSON({"result":"0200000001abcdef","error":null,"id":7})JSON");

}

int main() {
	/* An HTTP body arriving a few bytes at a time.  */
	{
		Jsmn::Parser p;
		auto got = std::vector<Jsmn::Object>();
		for (auto i = std::size_t(0); i < reply.size(); i += 5) {
			auto res = p.feed(reply.substr(i, 5));
			if (i + 5 < reply.size())
				assert(res.empty());
			got.insert(got.end(), res.begin(), res.end());
		}
		assert(got.size() == 1);
		auto const& js = got[0];
		assert(js.is_object());
		assert(js.size() == 3);
		assert(js["result"].is_string());
		assert(std::string(js["result"]) == "0200000001abcdef");
		assert(js["error"].is_null());
		assert(js["id"].is_number());
		assert(double(js["id"]) == 7);
		assert(js["missing"].is_null());
		assert(!js.has("missing"));
	}

	/* Error reply, with an escaped message.  */
	{
		Jsmn::Parser p;
		auto res = p.feed(R"JSON({"result":null,"error":{"code":-26,"message":"non-mandatory-script-verify-flag (\"bad\")"},"id":1}
		)JSON");
		assert(res.size() == 1);
		auto err = res[0]["error"];
		assert(err.is_object());
		assert(double(err["code"]) == -26);
		assert(std::string(err["message"]) == "non-mandatory-script-verify-flag (\"bad\")");
	}

	/* Arrays, booleans and iteration.  */
	{
		Jsmn::Parser p;
		auto res = p.feed(R"JSON({"hex":"00","complete":true,"errors":[1,2,3]})JSON");
		assert(res.size() == 1);
		assert(res[0]["complete"].is_boolean());
		assert(bool(res[0]["complete"]));
		auto errs = res[0]["errors"];
		assert(errs.is_array());
		auto sum = 0.0;
		for (auto e : errs)
			sum += double(e);
		assert(sum == 6);
		assert(errs[3].is_null());

		auto caught = false;
		try {
			for (auto e : res[0])
				(void) e;
		} catch (Jsmn::TypeError const&) {
			caught = true;
		}
		assert(caught);
	}

	/* Two replies in one chunk.  */
	{
		Jsmn::Parser p;
		auto res = p.feed("12.5 \"x\"\n");
		assert(res.size() == 2);
		assert(double(res[0]) == 12.5);
		assert(std::string(res[1]) == "x");
	}

	/* \u escapes come out as UTF-8, pairs included.  */
	{
		Jsmn::Parser p;
		auto res = p.feed(R"JSON(["caf\u00e9","\ud83d\ude00","a\/b"])JSON");
		assert(res.size() == 1);
		assert(std::string(res[0][0]) == "caf\xc3\xa9");
		assert(std::string(res[0][1]) == "\xf0\x9f\x98\x80");
		assert(std::string(res[0][2]) == "a/b");
	}

	/* Printing is compact and reparses to the same.  */
	{
		Jsmn::Parser p;
		auto res = p.feed("{ \"code\" : -26, \"ok\" : [ true, null, \"x\\ty\" ] }");
		assert(res.size() == 1);
		auto os = std::ostringstream();
		os << res[0];
		assert(os.str() == "{\"code\":-26,\"ok\":[true,null,\"x\\ty\"]}");
		assert(res[0].keys() == (std::vector<std::string>{"code", "ok"}));
	}

	/* A closer with nothing open.  */
	{
		Jsmn::Parser p;
		auto caught = false;
		try {
			p.feed("]");
		} catch (Jsmn::ParseError const&) {
			caught = true;
		}
		assert(caught);
	}

	/* Garbage is rejected with its position.  */
	{
		Jsmn::Parser p;
		auto caught = false;
		try {
			p.feed("{\"result\": ]");
		} catch (Jsmn::ParseError const& e) {
			caught = true;
			assert(e.get_input().find("result") != std::string::npos);
		}
		assert(caught);
	}

	return 0;
}
