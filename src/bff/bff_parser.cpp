#include "bff_parser.hpp"
#include "parser.hpp"
#include <stdexcept>

namespace lazor {
namespace bff {

namespace {
std::unique_ptr<BoardFile> finish(ParserContext& ctx, int result) {
    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }
    if (ctx.file->grid().empty()) {
        throw std::runtime_error("Parse error: no GRID found");
    }
    return std::move(ctx.file);
}
}  // namespace

std::unique_ptr<BoardFile> parse_file(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "r");
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    ParserContext ctx;
    yyscan_t scanner;
    yylex_init_extra(&ctx, &scanner);
    yyset_in(file, scanner);

    int result = yyparse(scanner, &ctx);

    yylex_destroy(scanner);
    fclose(file);

    return finish(ctx, result);
}

std::unique_ptr<BoardFile> parse_string(const std::string& input) {
    ParserContext ctx;
    yyscan_t scanner;
    yylex_init_extra(&ctx, &scanner);

    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner);

    int result = yyparse(scanner, &ctx);

    yy_delete_buffer(buffer, scanner);
    yylex_destroy(scanner);

    return finish(ctx, result);
}

} // namespace bff
} // namespace lazor
