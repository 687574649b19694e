#ifndef JSON_OUT_HPP
#define JSON_OUT_HPP

#include"Json/Detail/Str.hpp"
#include<cstdint>
#include<memory>
#include<sstream>
#include<string>

namespace Json { class Out; }

namespace Json { namespace Detail {

typedef std::stringstream Content;

/* A single-level object whose values are strings or
 * unsigned integers, as written on one log line.  */
class Object {
private:
	Json::Out& up;
	Content& content;
	bool started;

	void key(std::string const& name) {
		if (started)
			content << ", ";
		else
			started = true;
		content << "\"" << Str::to_escaped(name) << "\": ";
	}

public:
	Object(Json::Out& up_, Content& content_)
		: up(up_), content(content_), started(false) {
		content << '{';
	}

	Object& field(std::string const& name, std::string const& value) {
		key(name);
		content << "\"" << Str::to_escaped(value) << "\"";
		return *this;
	}
	Object& field(std::string const& name, char const* value) {
		return field(name, std::string(value));
	}
	Object& field(std::string const& name, std::uint64_t value) {
		key(name);
		content << std::dec << value;
		return *this;
	}

	Json::Out& end_object() {
		content << '}';
		return up;
	}
};

}}

namespace Json {

/** class Json::Out
 *
 * @brief builds the text of one JSON object.
 *
 * @desc Use as:
 *
 *     auto s = Json::Out()
 *         .start_object()
 *             .field("level", "info")
 *             .field("attempts", n)
 *         .end_object()
 *         .output();
 */
class Out {
private:
	std::shared_ptr<Json::Detail::Content> content;

public:
	Out() : content(std::make_shared<Json::Detail::Content>()) { }

	std::string output() const {
		return content->str();
	}

	Json::Detail::Object start_object() {
		return Json::Detail::Object(*this, *content);
	}
};

}

#endif /* !defined(JSON_OUT_HPP) */
