Array box(const Array& a) {
  return Array::boxed(a);
}

Array unbox(const Array& a) {
  if (!a.holds<Array>()) {
    type_error("Cannot unbox a " + std::string(element_kind_name(a.kind())) + " array",
               {operand_info(a)});
  }
  if (!a.is_scalar()) {
    type_error("Cannot unbox an array of " + std::to_string(a.element_count()) + " boxes",
               {operand_info(a)});
  }
  return a.elements<Array>()[0];
}

Array match(const Array& a, const Array& b) {
  return Array::byte(arrays_match(a, b) ? 1 : 0);
}

Array length_of(const Array& a) {
  return Array::number(static_cast<double>(a.row_count()));
}

Array shape_of(const Array& a) {
  return Array::number_list(std::vector<double>(a.shape().begin(), a.shape().end()));
}

Array rank_of(const Array& a) {
  return Array::number(static_cast<double>(a.rank()));
}

Array random_scalar(std::mt19937_64& rng) {
  std::uniform_real_distribution<double> distribution(0.0, 1.0);
  return Array::number(distribution(rng));
}
