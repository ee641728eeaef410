template<typename FieldT>
class digest_gadget {
private:
    const sha512_config<FieldT>& config;
    decompose_gadget<FieldT> decompose;
    addition_gadget<FieldT> adder;

public:
    explicit digest_gadget(const sha512_config<FieldT>& config) :
        config(config), decompose(config), adder(config) {}

    assigned_state initialize(layouter<FieldT>& l) const
    {
        assigned_state iv;
        for (size_t i = 0; i < SHA512_STATE_WORDS; i++) {
            iv[i] = decompose.load_constant(l, tfm::format("iv %d", i), SHA512_IV[i]);
        }
        return iv;
    }

    /** Next chaining value: chaining + working, word by word, modulo 2^64. */
    assigned_state feed_forward(layouter<FieldT>& l, const assigned_state& chaining,
                                const assigned_state& working, const std::string& prefix) const
    {
        assigned_state next;
        for (size_t i = 0; i < SHA512_STATE_WORDS; i++) {
            next[i] = adder.add(l, tfm::format("%s H[%d]", prefix, i), {chaining[i], working[i]});
        }
        return next;
    }

    void expose(layouter<FieldT>& l, const assigned_state& digest) const
    {
        for (size_t i = 0; i < SHA512_STATE_WORDS; i++) {
            l.constrain_instance(digest[i].dense, config.digest, i);
        }
    }
};
