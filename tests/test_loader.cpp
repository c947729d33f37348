// test_loader.cpp - delimited text parsing, column normalisation and table building
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "fertiblend/Loader.h"
#include "fertiblend/TableFormats.h"
#include "test_fixtures.h"

#include <memory>
#include <string>
#include <vector>

#ifdef FERTIBLEND_ARROW_ENABLED
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <arrow/ipc/api.h>
#include <parquet/arrow/writer.h>
#endif

using namespace fertiblend;

namespace {

RawTable parse(const std::string& text, const std::string& name) {
    RawTable t;
    Error err;
    REQUIRE(ParseDelimitedText(text, name, &t, &err));
    return t;
}

bool build(const std::string& fields, const std::string& reqs, const std::string& products,
           InputTables* out, Error* err) {
    return BuildInputTables(parse(fields, "fields"), parse(reqs, "requirements"),
                            parse(products, "products"), out, err);
}

#ifdef FERTIBLEND_ARROW_ENABLED
std::shared_ptr<arrow::Table> build_fields_table() {
    arrow::StringBuilder ids, crops;
    arrow::DoubleBuilder areas;
    REQUIRE(ids.AppendValues(std::vector<std::string>{"P1", "P2"}).ok());
    REQUIRE(crops.AppendValues(std::vector<std::string>{"maiz", "maiz"}).ok());
    REQUIRE(areas.AppendValues(std::vector<double>{10.0, 2.5}).ok());
    std::shared_ptr<arrow::Array> a, b, c;
    REQUIRE(ids.Finish(&a).ok());
    REQUIRE(crops.Finish(&b).ok());
    REQUIRE(areas.Finish(&c).ok());
    auto schema = arrow::schema({arrow::field("Potrero", arrow::utf8()),
                                 arrow::field("cultivo", arrow::utf8()),
                                 arrow::field("superficie_ha", arrow::float64())});
    return arrow::Table::Make(schema, {a, b, c});
}
#endif

} // namespace

TEST_CASE("ParseDelimitedText: Delimiters and Encoding", "[loader][csv]") {
    SECTION("Comma separated with CRLF line endings") {
        auto t = parse("potrero,cultivo,superficie_ha\r\nP1,maiz,10\r\n", "fields");
        REQUIRE(t.delimiter == ',');
        REQUIRE(t.columns.size() == 3);
        REQUIRE(t.rows.size() == 1);
        REQUIRE(t.rows[0][2] == "10");
    }

    SECTION("Semicolon separated is detected") {
        auto t = parse("potrero;cultivo;superficie_ha\nP1;maiz;10,5\n", "fields");
        REQUIRE(t.delimiter == ';');
        REQUIRE(t.columns[1] == "cultivo");
        REQUIRE(t.rows[0][2] == "10,5");
    }

    SECTION("Tab separated is detected") {
        auto t = parse("potrero\tcultivo\tsuperficie_ha\nP1\tmaiz\t4\n", "fields");
        REQUIRE(t.delimiter == '\t');
        REQUIRE(t.rows[0][0] == "P1");
    }

    SECTION("UTF-8 BOM is stripped from the first header") {
        auto t = parse("\xEF\xBB\xBFpotrero,cultivo,superficie_ha\nP1,maiz,10\n", "fields");
        REQUIRE(t.columns[0] == "potrero");
        REQUIRE(t.ColumnIndex("potrero") == 0);
    }

    SECTION("Quoted cells keep embedded delimiters") {
        auto t = parse("producto,N_pct\n\"Mezcla 10,20\",10\n", "products");
        REQUIRE(t.rows.size() == 1);
        REQUIRE(t.rows[0][0] == "Mezcla 10,20");
        REQUIRE(t.rows[0][1] == "10");
    }

    SECTION("Blank lines are skipped and short rows padded") {
        auto t = parse("a,b,c\n\n1,2\n   \n4,5,6\n", "t");
        REQUIRE(t.rows.size() == 2);
        REQUIRE(t.rows[0].size() == 3);
        REQUIRE(t.rows[0][2].empty());
    }

    SECTION("Cells are trimmed") {
        auto t = parse(" potrero , cultivo \n  P1 ,  maiz \n", "fields");
        REQUIRE(t.columns[0] == "potrero");
        REQUIRE(t.rows[0][1] == "maiz");
    }

    SECTION("Empty text has no header") {
        RawTable t;
        Error err;
        REQUIRE_FALSE(ParseDelimitedText("\n\n", "fields", &t, &err));
        REQUIRE(err.kind == ErrorKind::kIo);
        REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("no header"));
    }
}

TEST_CASE("TableFormatFromPath: Extensions", "[loader][formats]") {
    REQUIRE(TableFormatFromPath("data/potreros.csv") == TableFormatKind::kCSV);
    REQUIRE(TableFormatFromPath("data/potreros.txt") == TableFormatKind::kCSV);
    REQUIRE(TableFormatFromPath("potreros") == TableFormatKind::kCSV);
    REQUIRE(TableFormatFromPath("x/potreros.arrow") == TableFormatKind::kArrow);
    REQUIRE(TableFormatFromPath("x/potreros.Feather") == TableFormatKind::kArrow);
    REQUIRE(TableFormatFromPath("x/potreros.parquet") == TableFormatKind::kParquet);
}

TEST_CASE("ReadTableFromFile: Missing file is an IO error", "[loader][io]") {
    fixtures::TempDir dir;
    RawTable t;
    Error err;
    REQUIRE_FALSE(ReadTableFromFile(dir.file("nope.csv"), "fields", &t, &err));
    REQUIRE(err.kind == ErrorKind::kIo);
    REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("nope.csv"));
}

TEST_CASE("CanonicalColumnName: Synonyms", "[loader][columns]") {
    REQUIRE(CanonicalColumnName("P205_req_kg_ha") == "P2O5_req_kg_ha");
    REQUIRE(CanonicalColumnName("K20_pct") == "K2O_pct");
    REQUIRE(CanonicalColumnName("Potrero") == "potrero");
    REQUIRE(CanonicalColumnName("field_id") == "potrero");
    REQUIRE(CanonicalColumnName("PRECIO_CLP_TON") == "precio_CLP_ton");
    REQUIRE(CanonicalColumnName("dose_kg_ha") == "kg_ha");
    REQUIRE(CanonicalColumnName("notas") == "notas");
}

TEST_CASE("NormalizeColumns: Canonical column wins over synonym", "[loader][columns]") {
    auto t = parse("P2O5_pct,P205_pct\n10,20\n", "products");
    NormalizeColumns(&t);
    REQUIRE(t.columns[0] == "P2O5_pct");
    REQUIRE(t.columns[1] == "P205_pct");
}

TEST_CASE("ParseNumber: Lenient numeric coercion", "[loader][numbers]") {
    double v = 0.0;
    REQUIRE(ParseNumber(" 12.5 ", ',', &v));
    REQUIRE(v == 12.5);
    REQUIRE(ParseNumber("12,5", ';', &v));
    REQUIRE(v == 12.5);
    REQUIRE_FALSE(ParseNumber("", ',', &v));
    REQUIRE_FALSE(ParseNumber("abc", ',', &v));
    REQUIRE_FALSE(ParseNumber("12kg", ',', &v));
    REQUIRE_FALSE(ParseNumber("inf", ',', &v));
}

TEST_CASE("BuildInputTables: Valid inputs", "[loader][tables]") {
    InputTables tables;
    Error err;
    REQUIRE(build(fixtures::kFarmFieldsCsv, fixtures::kFarmRequirementsCsv, fixtures::kFarmProductsCsv,
                  &tables, &err));
    REQUIRE(err.ok());
    REQUIRE(tables.fields.size() == 3);
    REQUIRE(tables.fields[0].id == "Norte");
    REQUIRE(tables.fields[0].area_ha == 12.5);
    REQUIRE(tables.field_index.size() == 3);
    REQUIRE(tables.field_index.at("Vega") == 2);
    REQUIRE(tables.FindField("Sur") == &tables.fields[1]);
    REQUIRE(tables.FindField("Oeste") == nullptr);
    REQUIRE(tables.requirements.size() == 3);
    REQUIRE(tables.FindRequirement("trigo")->kg_per_ha[NutrientIndex(Nutrient::kP2O5)] == 70.0);
    REQUIRE(tables.product_order.size() == 4);
    REQUIRE(tables.product_order[0] == "Urea");
    REQUIRE(tables.FindProduct("MuriatoPotasio")->Fraction(Nutrient::kK2O) == 0.6);
    REQUIRE(tables.FindProduct("Urea")->dose_max == 400.0);
}

TEST_CASE("BuildInputTables: Synonyms, BOM and semicolons", "[loader][tables]") {
    InputTables tables;
    Error err;
    const std::string fields = "\xEF\xBB\xBFPotrero;Cultivo;Superficie_ha\nP1;maiz;2,5\n";
    const std::string reqs = "cultivo;N_req_kg_ha;P205_req_kg_ha;K20_req_kg_ha\nmaiz;100;40;20\n";
    const std::string products = "producto;N_pct;P205_pct;K20_pct;precio_CLP_ton\nMezcla;20;10;10;500000\n";
    REQUIRE(build(fields, reqs, products, &tables, &err));
    REQUIRE(tables.fields[0].area_ha == 2.5);
    REQUIRE(tables.FindRequirement("maiz")->kg_per_ha[NutrientIndex(Nutrient::kP2O5)] == 40.0);
    REQUIRE(tables.FindRequirement("maiz")->kg_per_ha[NutrientIndex(Nutrient::kK2O)] == 20.0);
    REQUIRE(tables.FindProduct("Mezcla")->percent[NutrientIndex(Nutrient::kK2O)] == 10.0);
}

TEST_CASE("BuildInputTables: Leniency defaults", "[loader][tables]") {
    InputTables tables;
    Error err;
    const std::string reqs = "cultivo,N_req_kg_ha,P2O5_req_kg_ha,K2O_req_kg_ha\nmaiz,160,,n/a\n";
    const std::string products =
        "producto,N_pct,P2O5_pct,K2O_pct,precio_CLP_ton,dosis_min_kg_ha,dosis_max_kg_ha\n"
        "Urea,46,,,450000,,\n"
        "Regalo,0,0,0,,,\n";
    REQUIRE(build(fixtures::kFieldsCsv, reqs, products, &tables, &err));

    const CropRequirement* req = tables.FindRequirement("maiz");
    REQUIRE(req->kg_per_ha[NutrientIndex(Nutrient::kP2O5)] == 0.0);
    REQUIRE(req->kg_per_ha[NutrientIndex(Nutrient::kK2O)] == 0.0);

    const Product* urea = tables.FindProduct("Urea");
    REQUIRE(urea->percent[NutrientIndex(Nutrient::kP2O5)] == 0.0);
    REQUIRE(urea->dose_min == 0.0);
    REQUIRE(urea->dose_max == kUnboundedDose);
    REQUIRE(urea->HasUnboundedMax());
    REQUIRE(tables.FindProduct("Regalo")->price_per_tonne == 0.0);
}

TEST_CASE("BuildInputTables: Dose bound columns are optional", "[loader][tables]") {
    InputTables tables;
    Error err;
    const std::string products = "producto,N_pct,P2O5_pct,K2O_pct,precio_CLP_ton\nUrea,46,0,0,450000\n";
    REQUIRE(build(fixtures::kFieldsCsv, fixtures::kRequirementsCsv, products, &tables, &err));
    REQUIRE(tables.FindProduct("Urea")->dose_min == 0.0);
    REQUIRE(tables.FindProduct("Urea")->HasUnboundedMax());
}

TEST_CASE("BuildInputTables: Missing columns", "[loader][errors]") {
    InputTables tables;
    Error err;

    SECTION("Area column missing from fields") {
        REQUIRE_FALSE(build("potrero,cultivo\nP1,maiz\n", fixtures::kRequirementsCsv, fixtures::kProductsCsv,
                            &tables, &err));
        REQUIRE(err.kind == ErrorKind::kMissingColumn);
        REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("superficie_ha"));
        REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("fields"));
    }

    SECTION("Price column missing from products") {
        REQUIRE_FALSE(build(fixtures::kFieldsCsv, fixtures::kRequirementsCsv,
                            "producto,N_pct,P2O5_pct,K2O_pct\nUrea,46,0,0\n", &tables, &err));
        REQUIRE(err.kind == ErrorKind::kMissingColumn);
        REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("precio_CLP_ton"));
    }

    SECTION("Requirement column missing") {
        REQUIRE_FALSE(build(fixtures::kFieldsCsv, "cultivo,N_req_kg_ha,P2O5_req_kg_ha\nmaiz,1,2\n",
                            fixtures::kProductsCsv, &tables, &err));
        REQUIRE(err.kind == ErrorKind::kMissingColumn);
        REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("K2O_req_kg_ha"));
    }
}

TEST_CASE("BuildInputTables: Unknown crop", "[loader][errors]") {
    InputTables tables;
    Error err;
    REQUIRE_FALSE(build("potrero,cultivo,superficie_ha\nP1,maiz,10\nP2,avena,4\n", fixtures::kRequirementsCsv,
                        fixtures::kProductsCsv, &tables, &err));
    REQUIRE(err.kind == ErrorKind::kUnknownCrop);
    REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("P2"));
    REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("avena"));
}

TEST_CASE("BuildInputTables: Invalid rows", "[loader][errors]") {
    InputTables tables;
    Error err;

    SECTION("Non-positive area") {
        REQUIRE_FALSE(build("potrero,cultivo,superficie_ha\nP1,maiz,0\n", fixtures::kRequirementsCsv,
                            fixtures::kProductsCsv, &tables, &err));
        REQUIRE(err.kind == ErrorKind::kInvalidInput);
        REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("area"));
    }

    SECTION("Duplicate field identifier") {
        REQUIRE_FALSE(build("potrero,cultivo,superficie_ha\nP1,maiz,1\nP1,maiz,2\n", fixtures::kRequirementsCsv,
                            fixtures::kProductsCsv, &tables, &err));
        REQUIRE(err.kind == ErrorKind::kInvalidInput);
        REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("duplicate"));
    }

    SECTION("Nutrient content above 100%") {
        REQUIRE_FALSE(build(fixtures::kFieldsCsv, fixtures::kRequirementsCsv,
                            "producto,N_pct,P2O5_pct,K2O_pct,precio_CLP_ton\nX,120,0,0,1\n", &tables, &err));
        REQUIRE(err.kind == ErrorKind::kInvalidInput);
        REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("[0,100]"));
    }

    SECTION("Minimum dose above maximum dose") {
        REQUIRE_FALSE(build(fixtures::kFieldsCsv, fixtures::kRequirementsCsv,
                            "producto,N_pct,P2O5_pct,K2O_pct,precio_CLP_ton,dosis_min_kg_ha,dosis_max_kg_ha\n"
                            "X,10,0,0,1,50,20\n",
                            &tables, &err));
        REQUIRE(err.kind == ErrorKind::kInvalidInput);
        REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("exceeds maximum dose"));
    }

    SECTION("Empty product table") {
        REQUIRE_FALSE(build(fixtures::kFieldsCsv, fixtures::kRequirementsCsv,
                            "producto,N_pct,P2O5_pct,K2O_pct,precio_CLP_ton\n", &tables, &err));
        REQUIRE(err.kind == ErrorKind::kInvalidInput);
        REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("no rows"));
    }
}

TEST_CASE("LoadInputTables: Reads files from disk", "[loader][io]") {
    fixtures::TempDir dir;
    InputPaths paths;
    paths.fields = fixtures::write_text(dir.file("potreros.csv"), fixtures::kFarmFieldsCsv);
    paths.requirements = fixtures::write_text(dir.file("requerimientos.csv"), fixtures::kFarmRequirementsCsv);
    paths.products = fixtures::write_text(dir.file("productos.csv"), fixtures::kFarmProductsCsv);

    InputTables tables;
    Error err;
    REQUIRE(LoadInputTables(paths, &tables, &err));
    REQUIRE(tables.fields.size() == 3);
    REQUIRE(tables.products.size() == 4);

    paths.products = dir.file("missing.csv");
    REQUIRE_FALSE(LoadInputTables(paths, &tables, &err));
    REQUIRE(err.kind == ErrorKind::kIo);
    REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("products"));
}

#ifdef FERTIBLEND_ARROW_ENABLED
TEST_CASE("ReadTableFromFile: Arrow IPC and Parquet fields", "[loader][formats][arrow]") {
    fixtures::TempDir dir;
    auto table = build_fields_table();

    const std::string arrow_path = dir.file("potreros.arrow");
    {
        auto outfile_result = arrow::io::FileOutputStream::Open(arrow_path);
        REQUIRE(outfile_result.ok());
        auto outfile = *outfile_result;
        auto writer_result = arrow::ipc::MakeFileWriter(outfile, table->schema());
        REQUIRE(writer_result.ok());
        auto writer = std::move(writer_result).ValueOrDie();
        REQUIRE(writer->WriteTable(*table).ok());
        REQUIRE(writer->Close().ok());
        REQUIRE(outfile->Close().ok());
    }

    const std::string parquet_path = dir.file("potreros.parquet");
    {
        auto outfile_result = arrow::io::FileOutputStream::Open(parquet_path);
        REQUIRE(outfile_result.ok());
        auto outfile = *outfile_result;
        REQUIRE(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, table->num_rows()).ok());
        REQUIRE(outfile->Close().ok());
    }

    for (const auto& path : {arrow_path, parquet_path}) {
        RawTable raw;
        Error err;
        INFO(path);
        REQUIRE(ReadTableFromFile(path, "fields", &raw, &err));
        std::vector<Field> fields;
        NormalizeColumns(&raw);
        REQUIRE(BuildFields(raw, &fields, &err));
        REQUIRE(fields.size() == 2);
        REQUIRE(fields[0].id == "P1");
        REQUIRE(fields[1].area_ha == 2.5);
    }
}
#else
TEST_CASE("ReadTableFromFile: Columnar formats need Arrow support", "[loader][formats]") {
    fixtures::TempDir dir;
    const std::string path = fixtures::write_text(dir.file("potreros.parquet"), "not parquet");
    RawTable raw;
    Error err;
    REQUIRE_FALSE(ReadTableFromFile(path, "fields", &raw, &err));
    REQUIRE(err.kind == ErrorKind::kIo);
    REQUIRE_THAT(err.message, Catch::Matchers::ContainsSubstring("not supported in this build"));
}
#endif
