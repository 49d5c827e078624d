// repricer.cpp/example/main.cpp
#include "dom_adapter.h"
#include "price_locator.h"
#include "repricer.h"

#include <iostream>
#include <string>

using namespace repricer_cpp;

int main() {
    std::string html = R"html(
    <h1>Spring Catalogue</h1>
    <ul>
      <li>Garden chair <span class="price">$49.99</span></li>
      <li>Patio table <span class="price">$1<sup>2</sup>9.00</span></li>
      <li>Parasol, was <s>$89.00</s> now <b>$75.50</b></li>
      <li>Lantern <a title="Under $20">$.99</a></li>
    </ul>
    <p>Free shipping on orders over $1,000.00.</p>
)html";

    AdjustOptions options;
    options.fragment = true;

    auto demo = [&](std::string const& title, Adjustment const& adjustment) {
        std::cout << title << "\n" << adjustHtml(html, adjustment, options) << "\n\n";
    };

    demo("**Absolute: -2.46**", Adjustment::absolute(-2.46));
    demo("**Absolute: +7395**", Adjustment::absolute(7395));
    demo("**Percentage: -14%**", Adjustment::percent(-14));
    demo("**Percentage: 39.2% (parsed)**", *Adjustment::parse("39.2%"));

    options.limit = 2;
    demo("**Limit: first two elements, +1**", Adjustment::absolute(1));

    dom::Document document = dom::Document::parse(html);
    std::cout << "**Located elements**\n";
    for (auto const& candidate : locatePrices(document.root())) {
        std::cout << "<" << candidate.node.tag_name() << "> " << candidate.amounts
                  << " amount(s): " << candidate.node.text_content() << "\n";
    }

    return 0;
}
