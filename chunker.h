#pragma once

#include <vector>
#include <cstdint>
#include "lib/libae.h"
#include "chunk.h"
#include "source.h"

namespace ae
{
	using std::vector;
	using std::uint64_t;

	enum class chunk_status : char
	{
		ok,
		end,
		io_error
	};

	/*
	* one chunking session over a byte source
	* not thread safe, a session belongs to a single caller
	* without a ceiling (params::bounded false) the carry buffer holds a whole
	* chunk, however long; set max_size to bound memory
	*/
	class chunker
	{
	private:
		byte_source &src;
		params cfg;

		// bytes read but not emitted yet, live from carry[head]
		vector<char> carry;
		size_t head;
		scan_state state;

		uint64_t emitted;
		bool eof;
		int error;

		bool fill(size_t want);
	public:
		chunker(byte_source &src, const params &cfg);
		chunker(const chunker &) = delete;
		chunker &operator=(const chunker &) = delete;

		chunk_status next(chunk &out);

		const params &config() const { return cfg; }
		uint64_t consumed() const { return emitted; }
		// errno of the failed read once next returned io_error
		int last_error() const { return error; }
	};
}
