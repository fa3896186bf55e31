#pragma once

#include <utility>

#include <QString>
#include <QStringList>

namespace Utils {

struct Result {
	bool ok = true;
	QStringList errors;

	static Result success() { return Result{}; }

	static Result failure(const QString& msg)
	{
		Result r;
		r.ok = false;
		r.errors.push_back(msg);
		return r;
	}

	static Result failure(QStringList msgs)
	{
		Result r;
		r.ok = false;
		r.errors = std::move(msgs);
		return r;
	}

	void addError(const QString& msg)
	{
		ok = false;
		errors.push_back(msg);
	}

	QString message() const { return errors.join(QStringLiteral("; ")); }

	explicit operator bool() const { return ok; }
};

// A Result that also carries a typed error code so callers can branch on the
// failure class instead of parsing messages. Code{} means "no error".
template <typename Code>
struct CodedResult : Result {
	Code code{};

	static CodedResult success() { return CodedResult{}; }

	static CodedResult failure(Code c, const QString& msg)
	{
		CodedResult r;
		r.ok = false;
		r.code = c;
		r.errors.push_back(msg);
		return r;
	}

	static CodedResult from(Code c, const Result& other)
	{
		CodedResult r;
		r.ok = other.ok;
		r.errors = other.errors;
		if (!other.ok)
			r.code = c;
		return r;
	}

	bool is(Code c) const { return !ok && code == c; }
};

} // namespace Utils
