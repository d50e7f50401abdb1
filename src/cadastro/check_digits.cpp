#include "check_digits.hpp"
#include <algorithm>

namespace duckdb {
namespace brkit {
namespace cadastro {

// Weight tables for the two check digits of each document.
// CPF weights descend from (position count + 1) down to 2.
const int CheckDigits::WEIGHTS_CPF_1[9] = {10, 9, 8, 7, 6, 5, 4, 3, 2};
const int CheckDigits::WEIGHTS_CPF_2[10] = {11, 10, 9, 8, 7, 6, 5, 4, 3, 2};
const int CheckDigits::WEIGHTS_CNPJ_1[12] = {5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
const int CheckDigits::WEIGHTS_CNPJ_2[13] = {6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};

const char* DocumentTypeName(DocumentType type) {
    switch (type) {
        case DocumentType::CPF: return "CPF";
        case DocumentType::CNPJ: return "CNPJ";
        default: return "";
    }
}

int CheckDigits::ModulusElevenDigit(int weighted_sum) {
    int remainder = weighted_sum % 11;
    return (remainder < 2) ? 0 : (11 - remainder);
}

int CheckDigits::WeightedSum(const std::string& digits, const int* weights, size_t weight_count) {
    int sum = 0;
    for (size_t i = 0; i < weight_count; i++) {
        sum += (digits[i] - '0') * weights[i];
    }
    return sum;
}

// ======================================================================
// Shared layout: N payload digits followed by two check digits.
// The first check digit covers the payload, the second covers the
// payload plus the first check digit.
// ======================================================================
bool CheckDigits::ValidateWithWeights(
    const std::string& digits,
    size_t expected_length,
    const int* first_weights,
    const int* second_weights) {

    if (digits.length() != expected_length) {
        return false;
    }

    if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }

    // Repeated sequences such as 111.111.111-11 pass the arithmetic but are never issued
    if (std::all_of(digits.begin(), digits.end(), [&](char c) { return c == digits[0]; })) {
        return false;
    }

    size_t first_pos = expected_length - 2;
    size_t second_pos = expected_length - 1;

    int first_check_digit = ModulusElevenDigit(WeightedSum(digits, first_weights, first_pos));
    if (digits[first_pos] - '0' != first_check_digit) {
        return false;
    }

    int second_check_digit = ModulusElevenDigit(WeightedSum(digits, second_weights, second_pos));
    return digits[second_pos] - '0' == second_check_digit;
}

bool CheckDigits::ValidateCpf(const std::string& digits) {
    return ValidateWithWeights(digits, CPF_LENGTH, WEIGHTS_CPF_1, WEIGHTS_CPF_2);
}

bool CheckDigits::ValidateCnpj(const std::string& digits) {
    return ValidateWithWeights(digits, CNPJ_LENGTH, WEIGHTS_CNPJ_1, WEIGHTS_CNPJ_2);
}

DocumentType CheckDigits::Classify(const std::string& digits) {
    switch (digits.length()) {
        case CPF_LENGTH:
            return ValidateCpf(digits) ? DocumentType::CPF : DocumentType::NONE;
        case CNPJ_LENGTH:
            return ValidateCnpj(digits) ? DocumentType::CNPJ : DocumentType::NONE;
        default:
            return DocumentType::NONE;
    }
}

} // namespace cadastro
} // namespace brkit
} // namespace duckdb
