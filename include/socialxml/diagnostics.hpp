// diagnostics.hpp - validation errors and the reporter the validators share
#pragma once
#include <string>
#include <vector>

namespace socialxml {

enum class ErrorKind { syntax, structure, semantic };

// "syntax" / "structure" / "semantic"
const char* to_string(ErrorKind kind);

struct ValidationError {
    int line = 0;
    std::string description;
    ErrorKind kind = ErrorKind::structure;
};

struct ValidationResult {
    bool is_valid = false;
    size_t error_count = 0;
    std::vector<ValidationError> errors; // sorted by line, stable on ties
};

struct ErrorReporter {
    std::vector<ValidationError>* errors = nullptr;
    void emit(ErrorKind kind, int line, std::string description){
        if(errors) errors->push_back(ValidationError{line, std::move(description), kind});
    }
    void syntax(int line, std::string description){ emit(ErrorKind::syntax, line, std::move(description)); }
    void structure(int line, std::string description){ emit(ErrorKind::structure, line, std::move(description)); }
    void semantic(int line, std::string description){ emit(ErrorKind::semantic, line, std::move(description)); }
};

} // namespace socialxml
