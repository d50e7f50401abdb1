#pragma once

#include <string>
#include <cstddef>

namespace duckdb {
namespace brkit {
namespace cadastro {

// Document type detected from a digit sequence
enum class DocumentType {
    NONE = 0,  // Wrong length or failed checksum
    CPF = 1,   // Cadastro de Pessoas Fisicas (11 digits)
    CNPJ = 2   // Cadastro Nacional da Pessoa Juridica (14 digits)
};

const char* DocumentTypeName(DocumentType type);

// Receita Federal check digit rules for CPF and CNPJ.
// All entry points take an already extracted digit sequence ('0'-'9' only)
// and are total: anything malformed is simply invalid.
class CheckDigits {
public:
    static constexpr size_t CPF_LENGTH = 11;
    static constexpr size_t CNPJ_LENGTH = 14;

    static bool ValidateCpf(const std::string& digits);
    static bool ValidateCnpj(const std::string& digits);

    // CPF for 11 valid digits, CNPJ for 14 valid digits, NONE otherwise
    static DocumentType Classify(const std::string& digits);

    // Modulus 11: remainder < 2 -> 0, otherwise 11 - remainder
    static int ModulusElevenDigit(int weighted_sum);

private:
    static bool ValidateWithWeights(
        const std::string& digits,
        size_t expected_length,
        const int* first_weights,
        const int* second_weights);

    static int WeightedSum(const std::string& digits, const int* weights, size_t weight_count);

    // Weight tables (const arrays stored in .cpp file)
    static const int WEIGHTS_CPF_1[9];
    static const int WEIGHTS_CPF_2[10];
    static const int WEIGHTS_CNPJ_1[12];
    static const int WEIGHTS_CNPJ_2[13];
};

} // namespace cadastro
} // namespace brkit
} // namespace duckdb
