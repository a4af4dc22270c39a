#pragma once
#include <string_view>

namespace sj::test::doc {
inline constexpr std::string_view employees_v = R"(
    {" employees":[
    {"firstName":"Jo:hn", "lastName":"Doe,Foe"},
    {"firstName":"An\"na", "lastName":"Smith Jack"},
    {"firstName":"Peter", "lastName":"Jones"},
    true,
    745
    ]}
    )";

inline constexpr std::string_view nested_v = R"({"a":8, "b": {"c": {"d":9}}, "e":{"f":{"g":10, "h":[1,2,3]}}, "i":11})";

inline constexpr std::string_view mixed_array_v = R"(["a",2,true,{"apple":"fruit"}])";

inline constexpr std::string_view glossary_v = R"(
    {"glossary":
        {"GlossDiv":
            {"title": "S",
                "GlossList":
                    {"GlossEntry":
                        {"Acronym": "SGML", "ID": "SGML", "SortAs": "SGML",
                        "GlossTerm": "Standard Generalized Markup Language",
                        "Abbrev": "ISO 8879:1986",
                        "GlossDef": {"para": "A meta-markup language, used to create markup languages such as DocBook.",
                        "GlossSeeAlso": ["GML", "XML"]},
                        "GlossSee": "markup"}
                    }
            },
            "title": "example glossary"
        }
    }
    )";

inline constexpr std::string_view product_v =
	R"({"to": "8743d93a", "type": "response", "payload": {"result": {"units_in_pack": 30, "sku_id": 91, "price": 200.0, "manufacturer": {"id": 5, "url": "johnsons.com", "name": "jhonsons"}, "attributes": [{"display_name": "pack form", "value": "strip", "key": "pack_form"}, {"display_name": "drug form", "value": "tablet", "key": "drug_form"}, {"display_name": "strength", "value": "200 mg", "key": "strength"}, {"display_name": "name", "value": "paracetamol", "key": "name"}, {"display_name": "units in pack", "value": 30, "key": "units_in_pack"}], "brand": "crocin", "type": "allopathy", "name": "crocin 200 mg", "image_urls": ["http//1mg.com/3", "http//1mg.com/2"]}, "request_id": "0f2d9b9c"}, "entity": null, "pid": "43abc6be"} )";
} // namespace sj::test::doc
