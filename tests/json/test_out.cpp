#undef NDEBUG
#include"Json/Out.hpp"
#include<assert.h>
#include<cstdint>
#include<string>

int main() {
	assert(Json::Out().start_object().end_object().output() == "{}");

	/* A log line.  */
	{
		auto s = Json::Out()
			.start_object()
				.field("level", "info")
				.field("message", std::string("PaymentDispatcher: done"))
			.end_object()
			.output()
			;
		assert(s == "{\"level\": \"info\", \"message\": \"PaymentDispatcher: done\"}");
	}

	/* Numbers are bare.  */
	{
		auto s = Json::Out()
			.start_object()
				.field("total_cltv", std::uint32_t(89))
				.field("hops", std::size_t(3))
				.field("max", UINT64_MAX)
			.end_object()
			.output()
			;
		assert(s == "{\"total_cltv\": 89, \"hops\": 3, \"max\": 18446744073709551615}");
	}

	/* Fields added one at a time.  */
	{
		auto js = Json::Out();
		auto obj = js.start_object();
		for (auto i = 0; i < 3; ++i)
			obj.field(std::string(1, char('a' + i)), std::uint64_t(i));
		obj.end_object();
		assert(js.output() == "{\"a\": 0, \"b\": 1, \"c\": 2}");
	}

	/* Escapes, in names too.  */
	{
		auto s = Json::Out()
			.start_object()
				.field("say \"hi\"", std::string("a\nb\\c\t"))
				.field("ctl", std::string("\x01\x1f"))
				.field("utf8", std::string("\xc3\xa9"))
			.end_object()
			.output()
			;
		assert( s
		     == "{\"say \\\"hi\\\"\": \"a\\nb\\\\c\\t\""
			", \"ctl\": \"\\u0001\\u001f\""
			", \"utf8\": \"\xc3\xa9\"}"
		      );
	}

	return 0;
}
